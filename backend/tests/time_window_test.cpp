#include <cassert>

#include "core/TimeWindow.hpp"
#include "TestSupport.hpp"

int main() {
    {
        assert(TimeWindow::epochAt(0, 3600) == 0);
        assert(TimeWindow::epochAt(3599, 3600) == 0);
        assert(TimeWindow::epochAt(3600, 3600) == 1);
        assert(TimeWindow::epochAt(1700000000, 3600) == 472222);
    }

    {
        // floor, not truncation toward zero
        assert(TimeWindow::epochAt(-1, 60) == -1);
        assert(TimeWindow::epochAt(-60, 60) == -1);
        assert(TimeWindow::epochAt(-61, 60) == -2);
    }

    {
        ManualClock clock(6000);
        assert(TimeWindow::currentEpoch(clock, 60) == 100);
        clock.advance(59);
        assert(TimeWindow::currentEpoch(clock, 60) == 100);
        clock.advance(1);
        assert(TimeWindow::currentEpoch(clock, 60) == 101);
    }

    {
        SystemClock clock;
        assert(clock.now() > 1600000000);
    }

    return 0;
}

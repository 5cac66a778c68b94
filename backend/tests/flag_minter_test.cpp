#include <cassert>
#include <string>

#include "core/FlagMinter.hpp"
#include "crypto/Crypto.hpp"
#include "crypto/TruthHasher.hpp"
#include "TestSupport.hpp"

int main() {
    Crypto::init();

    const EngineConfig cfg = testConfig();
    ManualClock clock(6000);   // epoch 100
    FlagMinter minter(cfg, clock);

    const TruthDigest truth = TruthHasher::hash("admin_password_reuse");
    const std::string csalt = Crypto::randomSaltHex();
    const std::string salt1 = Crypto::randomSaltHex();
    const std::string salt2 = Crypto::randomSaltHex();

    {
        const FlagToken a = minter.mint("u1", "c1", truth, csalt, salt1, 100);
        const FlagToken b = minter.mint("u1", "c1", truth, csalt, salt1, 100);
        assert(a == b);
        assert(minter.mintCurrent("u1", "c1", truth, csalt, salt1) == a);
        assert(minter.currentEpoch() == 100);
    }

    {
        const FlagToken t = minter.mint("u1", "c1", truth, csalt, salt1, 100);
        assert(t.size() == minter.tokenLength());
        assert(t.size() == 9 + FlagMinter::BODY_CHARS + 1);
        assert(t.compare(0, 9, "FORENSIC{") == 0);
        assert(t.back() == '}');
        assert(minter.hasValidShape(t));
    }

    {
        // every input participates
        const FlagToken base = minter.mint("u1", "c1", truth, csalt, salt1, 100);
        assert(minter.mint("u2", "c1", truth, csalt, salt2, 100) != base);
        assert(minter.mint("u2", "c1", truth, csalt, salt1, 100) != base);
        assert(minter.mint("u1", "c2", truth, csalt, salt1, 100) != base);
        assert(minter.mint("u1", "c1", TruthHasher::hash("other"), csalt, salt1, 100) != base);
        assert(minter.mint("u1", "c1", truth, Crypto::randomSaltHex(), salt1, 100) != base);
        assert(minter.mint("u1", "c1", truth, csalt, salt2, 100) != base);
        assert(minter.mint("u1", "c1", truth, csalt, salt1, 101) != base);
    }

    {
        // field boundaries are unambiguous
        assert(minter.mint("u1c", "1", truth, csalt, salt1, 100) !=
               minter.mint("u1", "c1", truth, csalt, salt1, 100));
    }

    {
        EngineConfig other = cfg;
        other.secret_key = "another-secret-key-fedcba987654";
        FlagMinter m2(other, clock);
        assert(m2.mint("u1", "c1", truth, csalt, salt1, 100) !=
               minter.mint("u1", "c1", truth, csalt, salt1, 100));
    }

    {
        EngineConfig custom = cfg;
        custom.flag_prefix = "CTF[";
        custom.flag_suffix = "]";
        FlagMinter m3(custom, clock);
        const FlagToken t = m3.mint("u1", "c1", truth, csalt, salt1, 100);
        assert(t.compare(0, 4, "CTF[") == 0);
        assert(t.back() == ']');
        assert(m3.hasValidShape(t));
        assert(!minter.hasValidShape(t));
    }

    {
        const FlagToken t = minter.mint("u1", "c1", truth, csalt, salt1, 100);
        assert(!minter.hasValidShape(""));
        assert(!minter.hasValidShape("FORENSIC{}"));
        assert(!minter.hasValidShape(t.substr(0, t.size() - 1)));
        assert(!minter.hasValidShape(t + "}"));

        std::string bad_char = t;
        bad_char[9] = '+';
        assert(!minter.hasValidShape(bad_char));

        std::string bad_prefix = t;
        bad_prefix[0] = 'f';
        assert(!minter.hasValidShape(bad_prefix));
    }

    return 0;
}

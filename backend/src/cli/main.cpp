#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "../utils/logging.hpp"
#include "../config/EngineConfig.hpp"
#include "../core/Errors.hpp"
#include "../core/FlagEngine.hpp"
#include "../crypto/Crypto.hpp"
#include "../storage/FileStore.hpp"

static const char GENERIC_FLAG_REJECTION[] = "Invalid or expired flag.";

std::string prompt(const std::string& label) {
    std::cout << label;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

int askInt(const std::string& label) {
    while (true) {
        std::cout << label;
        int v;
        if (std::cin >> v) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return v;
        }
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
}

void listChallenges(const std::vector<Challenge>& challenges) {
    std::cout << "\n===== CHALLENGES =====\n";

    if (challenges.empty()) {
        std::cout << "No challenges authored.\n";
        return;
    }

    for (size_t i = 0; i < challenges.size(); i++) {
        const Challenge& c = challenges[i];
        std::cout << i + 1 << ". " << c.title << "\n"
            << "   ID: " << c.id << "\n"
            << "   Points: " << c.points << "\n"
            << "   Status: " << (c.is_active ? "active" : "inactive") << "\n"
            << "-----------------------------\n";
    }
}

// Returns an empty string when nothing was chosen.
std::string chooseChallenge(FlagEngine& engine) {
    auto challenges = engine.catalog().list();
    if (challenges.empty()) {
        std::cout << "No challenges available.\n";
        return {};
    }
    listChallenges(challenges);

    int sel = askInt("Choose challenge number: ");
    if (sel < 1 || (size_t)sel > challenges.size()) {
        std::cout << "Invalid selection.\n";
        return {};
    }
    return challenges[sel - 1].id;
}

// Returns an empty string when the user is unknown.
std::string chooseUser(FlagEngine& engine) {
    std::string name = prompt("Username: ");
    auto user = engine.accounts().findUserByName(name);
    if (!user) {
        std::cout << "Unknown user.\n";
        return {};
    }
    return user->id;
}

void showHistory(FlagEngine& engine, const std::string& user_id) {
    auto records = engine.submissionHistory(user_id);
    std::cout << "\n===== SUBMISSIONS =====\n";
    if (records.empty()) {
        std::cout << "No submissions yet.\n";
        return;
    }
    for (const auto& r : records) {
        std::cout << "- " << r.created_at
            << " | challenge=" << r.challenge_id
            << " | " << (r.is_correct ? "correct" : "incorrect") << "\n";
    }
}

bool loadConfiguration(int argc, char** argv, EngineConfig& cfg) {
    std::string error;
    bool ok = false;
    if (argc > 1) {
        ok = loadConfig(argv[1], cfg, error);
    } else {
        cfg = EngineConfig{};
        ok = finalizeConfig(cfg, error);
    }
    if (!ok) {
        std::cerr << "Configuration error: " << error << "\n";
    }
    return ok;
}

int main(int argc, char** argv) {
    try {
        Crypto::init();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    EngineConfig cfg;
    if (!loadConfiguration(argc, argv, cfg)) {
        std::cerr << "usage: flagforge [config.ini]  (FLAG_SECRET_KEY may be set in the environment)\n";
        return 1;
    }

    Log::init(cfg.log_file, cfg.log_level);
    spdlog::info("Config loaded from '{}': window={}s, salt rotation={}s",
        argc > 1 ? argv[1] : "environment", cfg.window_seconds, cfg.salt_rotation_seconds);

    SystemClock clock;
    try {
        FileStore store(cfg.data_dir);
        FlagEngine engine(cfg, clock, store, store, store);

        // MAIN LOOP
        while (true) {
            std::cout << "\n===== FLAG ENGINE =====\n"
                "1. Register user\n"
                "2. Author challenge\n"
                "3. Update challenge truth\n"
                "4. Activate / deactivate challenge\n"
                "5. List challenges\n"
                "6. Submit answer\n"
                "7. Submit flag\n"
                "8. Submission history\n"
                "9. Exit\n> ";

            int choice;
            if (!(std::cin >> choice)) {
                if (std::cin.eof()) break;
                std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
                continue;
            }
            std::cin.ignore();

            try {
                if (choice == 1) {
                    std::string name = prompt("Choose username: ");
                    User u = engine.accounts().registerUser(name);
                    std::cout << "Registered '" << u.username << "' (ID " << u.id << ").\n";
                }

                else if (choice == 2) {
                    std::string title = prompt("Title: ");
                    std::string truth = prompt("Answer (stored hashed only): ");
                    int points = askInt("Points: ");
                    Challenge c = engine.catalog().authorChallenge(title, truth, points);
                    std::cout << "Challenge created (ID " << c.id << ").\n";
                }

                else if (choice == 3) {
                    std::string id = chooseChallenge(engine);
                    if (id.empty()) continue;
                    std::string truth = prompt("New answer: ");
                    engine.catalog().updateTruth(id, truth);
                    std::cout << "Truth replaced. Previously issued flags are no longer valid.\n";
                }

                else if (choice == 4) {
                    std::string id = chooseChallenge(engine);
                    if (id.empty()) continue;
                    int active = askInt("1 = active, 0 = inactive: ");
                    engine.catalog().setActive(id, active != 0);
                    std::cout << "Updated.\n";
                }

                else if (choice == 5) {
                    listChallenges(engine.catalog().list());
                }

                else if (choice == 6) {
                    std::string user_id = chooseUser(engine);
                    if (user_id.empty()) continue;
                    std::string challenge_id = chooseChallenge(engine);
                    if (challenge_id.empty()) continue;
                    std::string answer = prompt("Your answer: ");

                    SubmissionMetadata meta;
                    meta.ip_address = "127.0.0.1";
                    meta.user_agent = "flagforge-cli";

                    SubmissionResult res = engine.submitAnswer(user_id, challenge_id, answer, meta);
                    std::cout << res.message << "\n";
                    if (res.flag) std::cout << "Flag: " << *res.flag << "\n";
                    if (res.points) std::cout << "Points earned: " << *res.points << "\n";
                }

                else if (choice == 7) {
                    std::string user_id = chooseUser(engine);
                    if (user_id.empty()) continue;
                    std::string challenge_id = chooseChallenge(engine);
                    if (challenge_id.empty()) continue;
                    std::string flag = prompt("Flag: ");

                    VerificationOutcome outcome = VerificationOutcome::InvalidOrExpired;
                    try {
                        outcome = engine.submitFlag(user_id, challenge_id, flag);
                    } catch (const MalformedTokenError&) {
                        outcome = VerificationOutcome::InvalidOrExpired;
                    }
                    std::cout << (outcome == VerificationOutcome::Valid ? "Flag accepted." : GENERIC_FLAG_REJECTION) << "\n";
                }

                else if (choice == 8) {
                    std::string user_id = chooseUser(engine);
                    if (user_id.empty()) continue;
                    showHistory(engine, user_id);
                }

                else if (choice == 9)
                    break;

                else std::cout << "Invalid.\n";
            }
            catch (const PreconditionError& e) {
                std::cout << "Request rejected: " << e.what() << "\n";
            }
            catch (const StorageError& e) {
                spdlog::error("Storage failure: {}", e.what());
                std::cout << "Storage failure. Please retry.\n";
            }
        }
    }
    catch (const EngineError& e) {
        spdlog::error("Fatal: {}", e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Goodbye!\n";
    return 0;
}

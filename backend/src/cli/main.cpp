#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <limits>
#include <memory>
#include <type_traits>
#include <variant>

#include "../utils/logging.hpp"
#include "../utils/Settings.hpp"
#include "../utils/text.hpp"
#include "../storage/Storage.hpp"
#include "../core/Scheduler.hpp"
#include "../session/SessionRegistry.hpp"
#include "../session/IdleSessionReaper.hpp"
#include "../trainers/SentenceGenerator.hpp"

std::string deckFileFor(const Settings& settings, const std::string& username) {
    return settings.data_dir + "/deck_" + username + ".dat";
}

std::string formatDue(const Item& it) {
    if (!it.next_review) return "now (never scheduled)";
    return std::to_string(*it.next_review) + " (UNIX)";
}

void listAllItems(const std::vector<Item>& items) {
    std::cout << "\n===== ALL ITEMS =====\n";

    if (items.empty()) {
        std::cout << "No items stored.\n";
        return;
    }

    for (size_t i = 0; i < items.size(); i++) {
        const Item& it = items[i];
        std::cout << i + 1 << ". " << it.front << "\n";
        std::cout << "   Back: " << it.back << "\n";
        std::cout << "   Interval: " << it.interval << " days\n";
        std::cout << "   Ease: " << it.ease_factor << "\n";
        std::cout << "   Reviews: " << it.review_count << "\n";
        std::cout << "   Next review: " << formatDue(it) << "\n";
        std::cout << "-----------------------------\n";
    }
}

int readMenuChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        if (std::cin.eof()) return -1;
        std::cin.clear();
        std::string dummy; std::getline(std::cin, dummy);
        return 0;
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return choice;
}

int chooseItemIndex(const std::vector<Item>& items) {
    if (items.empty()) {
        std::cout << "No items available.\n";
        return -1;
    }
    listAllItems(items);
    std::cout << "Choose item number: ";

    int sel = readMenuChoice();
    if (sel < 1 || (size_t)sel > items.size()) {
        std::cout << "Invalid selection.\n";
        return -1;
    }
    return sel - 1;
}

bool chooseMode(TrainingMode& mode) {
    std::cout << "\nChoose training mode:\n"
        " 1 = Standard (self-rated recall)\n"
        " 2 = Fill in the blank\n"
        " 3 = Multiple choice\n> ";
    switch (readMenuChoice()) {
    case 1: mode = TrainingMode::STANDARD; break;
    case 2: mode = TrainingMode::FILL_IN_BLANK; break;
    case 3: mode = TrainingMode::MULTIPLE_CHOICE; break;
    default:
        std::cout << "Invalid mode.\n";
        return false;
    }
    std::cout << modeExplanation(mode) << "\n";
    return true;
}

void printSummary(const SessionSummary& s) {
    std::cout << "\n===== SESSION SUMMARY =====\n"
        << "Mode: " << toString(s.mode) << "\n"
        << "Reviewed: " << s.items_reviewed << "\n"
        << "Correct: " << s.correct << "\n"
        << "Incorrect: " << s.incorrect << "\n"
        << "Accuracy: " << static_cast<int>(s.accuracy * 100.0 + 0.5) << "%\n"
        << "Duration: " << static_cast<long>(s.duration_seconds) << "s\n";
}

void printPresentation(const Presentation& p) {
    std::cout << "\n[" << p.progress.current << "/" << p.progress.total << "] "
        << p.front << "\n" << p.prompt << "\n";
    if (p.blanked_sentence) std::cout << "  " << *p.blanked_sentence << "\n";
    for (size_t i = 0; i < p.options.size(); ++i) {
        std::cout << "  " << i << ") " << p.options[i] << "\n";
    }
    if (p.mode == TrainingMode::STANDARD) {
        std::cout << "Rate your recall 0-5 (0 = blackout, 5 = perfect)";
    }
    std::cout << " (q to stop)\n> ";
}

void printGrade(const GradeResult& r) {
    std::cout << (r.is_correct ? "Correct" : "Incorrect")
        << " | rating " << static_cast<int>(r.rating) << "\n";
    if (r.similarity) std::cout << "Similarity: " << static_cast<int>(*r.similarity * 100.0 + 0.5) << "%\n";
    std::cout << "Answer: " << r.correct_answer << "\n";
    std::cout << "Next review in " << r.item.interval << " days\n";
}

// Runs one session to completion; updated items are written back into `items`.
void runReview(SessionRegistry& registry, IdleSessionReaper& reaper, const std::string& user,
    std::vector<Item>& items)
{
    TrainingMode mode;
    if (!chooseMode(mode)) return;

    BeginResult begun = registry.begin(user, items, mode, std::time(nullptr));
    switch (begun.status) {
    case BeginStatus::ALREADY_ACTIVE:
        std::cout << "A review session is already running; ending it first.\n";
        if (auto old = registry.end(user)) printSummary(*old);
        begun = registry.begin(user, items, mode, std::time(nullptr));
        break;
    case BeginStatus::NOTHING_DUE:
        std::cout << "No items due.\n";
        return;
    case BeginStatus::MODE_UNAVAILABLE:
        std::cout << "That mode is not available. Please try a different mode.\n";
        return;
    case BeginStatus::STARTED:
        break;
    }
    if (begun.status != BeginStatus::STARTED) return;

    std::cout << begun.items_due << " item(s) due.\n";
    auto session = begun.session;

    bool running = true;
    while (running) {
        ReviewSession::Next next = session->advance();

        std::visit([&](auto&& step) {
            using T = std::decay_t<decltype(step)>;
            if constexpr (std::is_same_v<T, QueueExhausted>) {
                running = false;
            }
            else if constexpr (std::is_same_v<T, RenderFailure>) {
                std::cout << "Could not prepare this item: " << step.message << "\n";
                TrainingMode other;
                std::cout << "Pick another mode to continue.";
                if (chooseMode(other)) session->switchMode(other);
                else running = false;
            }
            else {
                printPresentation(step);
                std::string answer;
                if (!std::getline(std::cin, answer) || Text::trim(answer) == "q") {
                    running = false;
                    return;
                }
                for (const auto& evicted : reaper.reap(std::time(nullptr))) {
                    std::cout << "Session timed out after inactivity.\n";
                    printSummary(evicted.second);
                }
                if (registry.get(user) != session) {
                    running = false;
                    return;
                }
                GradeResult graded = session->grade(answer);
                Storage::upsert(items, graded.item);
                printGrade(graded);
            }
        }, next);
    }

    if (auto summary = registry.end(user)) printSummary(*summary);
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Settings settings = Settings::fromEnvironment();
    Log::init(settings);

    std::string username, passphrase;
    std::cout << "Username: "; std::getline(std::cin, username);
    std::cout << "Passphrase: "; std::getline(std::cin, passphrase);
    username = Text::trim(username);
    if (username.empty() || passphrase.empty()) {
        std::cout << "Empty fields.\n";
        return 1;
    }

    std::vector<Item> items;
    const std::string deckFile = deckFileFor(settings, username);
    if (!Storage::loadItems(items, deckFile, passphrase)) {
        std::cout << "Could not open deck (wrong passphrase?).\n";
        return 1;
    }

    TrainerOptions options;
    options.generator = std::make_shared<BackContentSentenceGenerator>();
    options.distractor_count = settings.distractor_count;
    SessionRegistry registry(options, settings.max_review_items);
    IdleSessionReaper reaper(registry, std::chrono::minutes(settings.idle_timeout_minutes));
    Scheduler scheduler;

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "User: " << username << "\n"
            "1. Add Item\n"
            "2. Review Due Items\n"
            "3. List All Items\n"
            "4. Reset Item Schedule\n"
            "5. Save & Exit\n> ";

        int choice = readMenuChoice();
        if (choice < 0) choice = 5;

        if (choice == 1) {
            std::string front, back;
            std::cout << "Enter front: "; std::getline(std::cin, front);
            if (Text::trim(front).empty()) { std::cout << "Front required.\n"; continue; }

            std::cout << "Enter back (empty line to finish):\n";
            std::string line;
            while (std::getline(std::cin, line) && !line.empty()) {
                if (!back.empty()) back += "\n";
                back += line;
            }

            items.emplace_back(front, back);
            std::cout << "Item added.\n";
        }

        else if (choice == 2) {
            runReview(registry, reaper, username, items);
        }

        else if (choice == 3) {
            listAllItems(items);
        }

        else if (choice == 4) {
            int idx = chooseItemIndex(items); if (idx < 0) continue;
            scheduler.resetItem(items[idx], std::time(nullptr));
            std::cout << "Schedule reset.\n";
        }

        else if (choice == 5) {
            if (!Storage::saveItems(items, deckFile, passphrase)) {
                std::cout << "Error saving items.\n";
                return 1;
            }
            std::cout << "Goodbye!\n";
            break;
        }

        else std::cout << "Invalid.\n";
    }

    return 0;
}

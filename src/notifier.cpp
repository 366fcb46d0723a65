#include "notifier.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>

extern char** environ;

namespace fs = std::filesystem;

void BellNotifier::playAsync() {
    std::cout << '\a' << std::flush;
}

SoundNotifier::SoundNotifier(const std::string& soundFile,
                             const std::string& playerCommand,
                             std::shared_ptr<Logger> logger)
    : soundFile(soundFile),
      command(splitCommand(playerCommand)),
      logger(logger ? logger : std::make_shared<Logger>()),
      playing(std::make_shared<std::atomic<bool>>(false)),
      soundAvailable(false) {
    std::error_code ec;
    if (command.empty()) {
        this->logger->warning("No sound player configured, sound alerts disabled");
    } else if (!fs::is_regular_file(soundFile, ec)) {
        this->logger->warning("Sound file not found at " + soundFile + ", sound alerts disabled");
    } else {
        command.push_back(soundFile);
        soundAvailable = true;
        this->logger->info("Sound system initialized (" + command.front() + ")");
    }
}

std::vector<std::string> SoundNotifier::splitCommand(const std::string& commandLine) {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;
    char quote = '\0';

    for (char c : commandLine) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current += c;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            inWord = true;
        } else if (c == ' ' || c == '\t') {
            if (inWord) {
                words.push_back(current);
                current.clear();
                inWord = false;
            }
        } else {
            current += c;
            inWord = true;
        }
    }
    if (inWord) {
        words.push_back(current);
    }
    return words;
}

void SoundNotifier::playAsync() {
    if (!soundAvailable) {
        return;
    }

    if (playing->exchange(true)) {
        logger->debug("Alert sound still playing, skipping");
        return;
    }

    try {
        std::thread(&SoundNotifier::play, command, playing, logger).detach();
    } catch (const std::system_error& e) {
        playing->store(false);
        logger->error("Error starting sound thread: " + std::string(e.what()));
    }
}

void SoundNotifier::play(std::vector<std::string> command,
                         std::shared_ptr<std::atomic<bool>> playing,
                         std::shared_ptr<Logger> logger) {
    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (auto& word : command) {
        argv.push_back(&word[0]);
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        logger->error("Error playing sound: cannot start " + command.front() + ": " + std::strerror(rc));
        playing->store(false);
        return;
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (waited == -1) {
        logger->error("Error playing sound: " + std::string(std::strerror(errno)));
    } else if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        logger->error("Error playing sound: " + command.front() + " exited abnormally");
    }
    playing->store(false);
}

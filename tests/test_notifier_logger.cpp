/**
 * Notifier and Logger Tests
 */

#include "logger.h"
#include "notifier.h"
#include <iostream>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace {

std::shared_ptr<Logger> quietLogger() {
    return std::make_shared<Logger>(Logger::Level::Error);
}

fs::path scratchDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("sentinel_test_" + name + "_" + std::to_string(
                        std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

}  // namespace

void test_split_command() {
    std::cout << "\n=== Test: Split Command ===" << std::endl;

    auto words = SoundNotifier::splitCommand("aplay -q");
    assert(words.size() == 2);
    assert(words[0] == "aplay");
    assert(words[1] == "-q");

    words = SoundNotifier::splitCommand("  paplay   --volume 40000 ");
    assert(words.size() == 3);
    assert(words[2] == "40000");

    words = SoundNotifier::splitCommand("\"/opt/my player/play\" 'two words'");
    assert(words.size() == 2);
    assert(words[0] == "/opt/my player/play");
    assert(words[1] == "two words");

    assert(SoundNotifier::splitCommand("").empty());
    assert(SoundNotifier::splitCommand("   ").empty());

    std::cout << "✓ Split command test passed" << std::endl;
}

void test_sound_notifier_availability() {
    std::cout << "\n=== Test: Sound Availability ===" << std::endl;

    SoundNotifier missing("/nonexistent/alert.wav", "aplay -q", quietLogger());
    assert(!missing.available());
    // Unavailable notifiers do nothing
    missing.playAsync();
    assert(!missing.isPlaying());

    fs::path dir = scratchDir("sound");
    fs::path sound = dir / "alert.wav";
    std::ofstream(sound.string()) << "RIFF";

    SoundNotifier noPlayer(sound.string(), "", quietLogger());
    assert(!noPlayer.available());

    SoundNotifier notifier(sound.string(), "aplay -q", quietLogger());
    assert(notifier.available());
    assert(notifier.getCommand().size() == 3);
    assert(notifier.getCommand().back() == sound.string());

    fs::remove_all(dir);

    std::cout << "✓ Sound availability test passed" << std::endl;
}

void test_play_async_returns_immediately() {
    std::cout << "\n=== Test: Asynchronous Playback ===" << std::endl;

    fs::path dir = scratchDir("playback");
    fs::path sound = dir / "alert.wav";
    std::ofstream(sound.string()) << "RIFF";

    // The sound file becomes a positional argument of the shell
    SoundNotifier notifier(sound.string(), "sh -c 'sleep 0.3' player", quietLogger());
    assert(notifier.available());

    auto start = std::chrono::steady_clock::now();
    notifier.playAsync();
    // Skipped while the first cue plays
    notifier.playAsync();
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(elapsed < std::chrono::milliseconds(200));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (notifier.isPlaying() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(!notifier.isPlaying());

    // A failing player is logged, not reported
    SoundNotifier broken(sound.string(), "/nonexistent/player", quietLogger());
    broken.playAsync();
    deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (broken.isPlaying() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(!broken.isPlaying());

    fs::remove_all(dir);

    std::cout << "✓ Asynchronous playback test passed" << std::endl;
}

void test_null_and_bell_notifiers() {
    std::cout << "\n=== Test: Null/Bell Notifiers ===" << std::endl;

    NullNotifier null;
    assert(!null.available());
    null.playAsync();

    BellNotifier bell;
    assert(bell.available());

    std::cout << "✓ Null/bell notifiers test passed" << std::endl;
}

void test_log_levels() {
    std::cout << "\n=== Test: Log Levels ===" << std::endl;

    assert(Logger::parseLevel("debug") == Logger::Level::Debug);
    assert(Logger::parseLevel("INFO") == Logger::Level::Info);
    assert(Logger::parseLevel("Warn") == Logger::Level::Warning);
    assert(Logger::parseLevel("warning") == Logger::Level::Warning);
    assert(Logger::parseLevel("error") == Logger::Level::Error);

    bool threw = false;
    try {
        Logger::parseLevel("loud");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    assert(std::string(Logger::levelName(Logger::Level::Warning)) == "WARNING");

    Logger logger(Logger::Level::Warning);
    assert(!logger.isEnabled(Logger::Level::Info));
    assert(logger.isEnabled(Logger::Level::Error));
    logger.setLevel(Logger::Level::Debug);
    assert(logger.isEnabled(Logger::Level::Debug));
    assert(logger.getLogFile().empty());

    std::cout << "✓ Log levels test passed" << std::endl;
}

void test_log_file() {
    std::cout << "\n=== Test: Log File ===" << std::endl;

    fs::path dir = scratchDir("logs") / "logs";
    std::string logFile;
    {
        Logger logger(Logger::Level::Info, dir.string());
        logFile = logger.getLogFile();
        assert(!logFile.empty());
        assert(std::regex_match(fs::path(logFile).filename().string(),
                                std::regex("detection_log_\\d{8}_\\d{6}\\.log")));

        logger.debug("hidden");
        logger.info("visible");
        logger.logDetection("pistol", 0.95f, "alerts/alert_1.jpg");
    }

    std::ifstream in(logFile);
    std::string line;
    int lines = 0;
    bool sawDetection = false;
    std::regex format("\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2} - (DEBUG|INFO|WARNING|ERROR) - .*");
    while (std::getline(in, line)) {
        ++lines;
        assert(std::regex_match(line, format));
        assert(line.find("hidden") == std::string::npos);
        if (line.find("Detected: pistol (Confidence: 95.00%)") != std::string::npos) {
            sawDetection = true;
        }
    }
    assert(lines == 2);
    assert(sawDetection);

    fs::remove_all(dir.parent_path());

    std::cout << "✓ Log file test passed" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Notifier and Logger Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_split_command();
        test_sound_notifier_availability();
        test_play_async_returns_immediately();
        test_null_and_bell_notifiers();
        test_log_levels();
        test_log_file();

        std::cout << "\n========================================" << std::endl;
        std::cout << "  All tests passed! ✓" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}

#ifndef NOTIFIER_H
#define NOTIFIER_H

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "logger.h"

/**
 * @brief Plays an audible cue for an accepted alert
 *
 * playAsync must return without waiting for playback; failures are logged
 * by the implementation and never reported to the caller.
 */
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual bool available() const = 0;
    virtual void playAsync() = 0;
};

/**
 * @brief Notifier used when sound is disabled
 */
class NullNotifier : public Notifier {
public:
    bool available() const override { return false; }
    void playAsync() override {}
};

/**
 * @brief Rings the terminal bell
 */
class BellNotifier : public Notifier {
public:
    bool available() const override { return true; }
    void playAsync() override;
};

/**
 * @brief Plays a sound file through an external player process
 *
 * Each cue runs on a detached worker thread that spawns the player and waits
 * for it. A cue requested while the previous one is still playing is skipped.
 */
class SoundNotifier : public Notifier {
public:
    /**
     * @brief Constructor
     * @param soundFile Sound file to play; the notifier is unavailable if it does not exist
     * @param playerCommand Player executable and arguments, e.g. "aplay -q"
     * @param logger Logger for playback failures
     */
    SoundNotifier(const std::string& soundFile,
                  const std::string& playerCommand = "aplay -q",
                  std::shared_ptr<Logger> logger = nullptr);

    bool available() const override { return soundAvailable; }
    void playAsync() override;

    /**
     * @brief Whether a cue is currently being played
     */
    bool isPlaying() const { return playing->load(); }

    /**
     * @brief Player argv (command words followed by the sound file)
     */
    const std::vector<std::string>& getCommand() const { return command; }

    /**
     * @brief Split a command line on whitespace, honouring single and double quotes
     */
    static std::vector<std::string> splitCommand(const std::string& commandLine);

private:
    static void play(std::vector<std::string> command,
                     std::shared_ptr<std::atomic<bool>> playing,
                     std::shared_ptr<Logger> logger);

    std::string soundFile;
    std::vector<std::string> command;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<std::atomic<bool>> playing;
    bool soundAvailable;
};

#endif // NOTIFIER_H

#ifndef LOGGER_H
#define LOGGER_H

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

/**
 * @brief Thread-safe logger writing to the console and optionally to a log file
 *
 * Lines are formatted as "YYYY-MM-DD HH:MM:SS - LEVEL - message". Warnings and
 * errors go to stderr, everything else to stdout.
 */
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3
    };

    /**
     * @brief Constructor
     * @param minLevel Messages below this level are discarded
     * @param logDir Directory for the log file; empty to log to the console only
     */
    explicit Logger(Level minLevel = Level::Info, const std::string& logDir = "");
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(Level level, const std::string& message);

    void debug(const std::string& message) { log(Level::Debug, message); }
    void info(const std::string& message) { log(Level::Info, message); }
    void warning(const std::string& message) { log(Level::Warning, message); }
    void error(const std::string& message) { log(Level::Error, message); }

    /**
     * @brief Log a detection event
     * @param label Label of the detected object
     * @param score Confidence score of the detection
     * @param imagePath Path to the saved image (optional)
     */
    void logDetection(const std::string& label, float score, const std::string& imagePath = "");

    /**
     * @brief Log performance metrics
     * @param fps Current FPS
     * @param processingTime Processing time in seconds
     */
    void logPerformance(double fps, double processingTime);

    void setLevel(Level level) { minLevel = level; }
    Level getLevel() const { return minLevel; }
    bool isEnabled(Level level) const { return level >= minLevel.load(); }

    /**
     * @brief Path of the log file, empty when logging to the console only
     */
    const std::string& getLogFile() const { return logFile; }

    /**
     * @brief Parse a level name ("debug", "info", "warning"/"warn", "error")
     * @throws std::invalid_argument for unknown names
     */
    static Level parseLevel(const std::string& name);
    static const char* levelName(Level level);

private:
    std::atomic<Level> minLevel;
    std::string logFile;
    std::ofstream logStream;
    std::mutex logMutex;
};

#endif // LOGGER_H

#ifndef __SWAYIPC_LOG_HANDLER__
#define __SWAYIPC_LOG_HANDLER__

#include "Headers.hpp"

namespace swayipc {
/**
 * @brief Configures easylogging++ for the swayipc tools and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging, optionally writing stderr to disk.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.  Tools print replies and events through CLOG(INFO, "stdout").
   */
  static void setupStdoutLogger();

  /**
   * @brief Applies -v/--verbose: 0 keeps INFO and above, higher values
   * enable VLOG up to that level.
   */
  static void setVerbosity(int verbosity);

 private:
  /**
   * @brief Redirects stderr to a file created in the specified directory.
   */
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace swayipc
#endif  // __SWAYIPC_LOG_HANDLER__

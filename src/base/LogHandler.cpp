#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace sta {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // easylogging parses verbose arguments, see [Application Arguments]
  // in https://github.com/muflihun/easyloggingpp/blob/master/README.md
  // but it is non-intuitive so we explicitly set verbosity based on cxxopts
  START_EASYLOGGINGPP(*argc, *argv);

  // Easylogging configurations
  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.setGlobally(el::ConfigurationType::ToFile, "false");
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.set(el::Level::Debug, el::ConfigurationType::Enabled, "false");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::setupLogFile(el::Configurations *defaultConf,
                                const string &path, const string &filename,
                                bool logToStdout) {
  string fullFname = openLogFile(path, filename);

  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  // No rotation: a size of 0 disables the rollout check.
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, "0");

  if (logToStdout) {
    defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  } else {
    defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  }
  return fullFname;
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  // Easylogging configurations
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  // Values are always std::string
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

void LogHandler::setVerbosity(el::Configurations *defaultConf, int level) {
  el::Loggers::setVerboseLevel(level);
  defaultConf->set(el::Level::Debug, el::ConfigurationType::Enabled,
                   level > 0 ? "true" : "false");
}

string LogHandler::defaultLogDirectory() {
  return GetTempDirectory() + AGENT_NAME;
}

string LogHandler::openLogFile(const string &path, const string &filename) {
  string fullFname = path + "/" + filename;
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create logfile directory: " << fse.what()
                          << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_CREAT | O_APPEND | O_WRONLY,
                  0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}

}  // namespace sta

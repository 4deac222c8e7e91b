#include "SshCommandBuilder.hpp"

namespace sta {
vector<string> forwardFlag(const ForwardSpec& spec) {
  switch (spec.type) {
    case ForwardType::LOCAL:
      return {"-L", "localhost:" + to_string(spec.localPort) + ":" + spec.host +
                        ":" + to_string(spec.remotePort)};
    case ForwardType::DYNAMIC:
      return {"-D", to_string(spec.localPort)};
    case ForwardType::REMOTE:
      return {"-R", to_string(spec.remotePort) + ":" + spec.host + ":" +
                        to_string(spec.localPort)};
  }
  return {};
}

SshCommand buildSshArguments(const ConnectionSettings& settings,
                             const string& groupName,
                             const string& rawSpecText) {
  SshCommand command;
  ParsedGroup parsed = parseGroupSpecs(groupName, rawSpecText);
  command.specs = parsed.specs;
  command.errors = parsed.errors;
  if (command.specs.empty()) {
    if (command.errors.empty()) {
      command.errors.push_back("group '" + groupName +
                               "': no forward specs configured");
    }
    return command;
  }

  // -N: no remote command, -T: no pseudo terminal
  command.args = {
      "-N",
      "-T",
      "-o",
      "BatchMode=yes",
      "-o",
      "ExitOnForwardFailure=yes",
      "-o",
      "ServerAliveInterval=" + to_string(SSH_SERVER_ALIVE_INTERVAL),
      "-o",
      "ServerAliveCountMax=" + to_string(SSH_SERVER_ALIVE_COUNT_MAX),
      "-o",
      "SetEnv=TERM=" + settings.terminalType,
      "-p",
      to_string(settings.port),
  };
  for (const auto& spec : command.specs) {
    auto flag = forwardFlag(spec);
    command.args.insert(command.args.end(), flag.begin(), flag.end());
  }

  string destination = settings.host;
  if (!settings.user.empty()) {
    destination = settings.user + "@" + destination;
  }
  command.args.push_back(destination);
  return command;
}

SshCommand buildSshArgumentsOrThrow(const ConnectionSettings& settings,
                                    const string& groupName,
                                    const string& rawSpecText) {
  SshCommand command = buildSshArguments(settings, groupName, rawSpecText);
  if (!command.ok()) {
    string message = "Tunnel group '" + groupName + "' (\"" + rawSpecText +
                     "\") has no usable forward spec";
    for (const auto& error : command.errors) {
      message += "\n  " + error;
    }
    throw TunnelBuildException(message);
  }
  return command;
}
}  // namespace sta

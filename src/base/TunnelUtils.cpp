#include "TunnelUtils.hpp"

namespace sta {
namespace {
// Unlike split(), keeps empty trailing fields so "D:" has two fields.
vector<string> splitFields(const string& token) {
  vector<string> fields;
  size_t start = 0;
  while (true) {
    size_t colon = token.find(':', start);
    if (colon == string::npos) {
      fields.push_back(token.substr(start));
      break;
    }
    fields.push_back(token.substr(start, colon - start));
    start = colon + 1;
  }
  return fields;
}

uint16_t parsePort(const string& value, const string& what) {
  if (value.empty()) {
    throw TunnelParseException(what + " is missing");
  }
  if (value.find_first_not_of("0123456789") != string::npos) {
    throw TunnelParseException(what + " '" + value + "' is not numeric");
  }
  long port = 0;
  try {
    port = stol(value);
  } catch (const std::out_of_range&) {
    port = -1;
  }
  if (port < 1 || port > 65535) {
    throw TunnelParseException(what + " '" + value +
                               "' must be between 1 and 65535");
  }
  return static_cast<uint16_t>(port);
}

string parseHost(const string& value, const string& what) {
  if (value.empty()) {
    throw TunnelParseException(what + " must not be empty");
  }
  return value;
}

void expectFieldCount(const vector<string>& fields, size_t expected,
                      const string& layout) {
  // fields[0] is the type letter
  if (fields.size() - 1 != expected) {
    throw TunnelParseException("expected " + layout + " (" +
                               to_string(expected) + " field" +
                               (expected == 1 ? "" : "s") + "), got " +
                               to_string(fields.size() - 1));
  }
}

ForwardSpec parseForwardSpecOrThrow(const string& token) {
  if (token.empty()) {
    throw TunnelParseException("empty forward spec");
  }
  auto fields = splitFields(token);
  const string& type = fields[0];
  if (type == "L") {
    expectFieldCount(fields, 3, "L:localPort:remoteHost:remotePort");
    uint16_t localPort = parsePort(fields[1], "local port");
    string remoteHost = parseHost(fields[2], "remote host");
    uint16_t remotePort = parsePort(fields[3], "remote port");
    return ForwardSpec::local(localPort, remoteHost, remotePort);
  }
  if (type == "D") {
    expectFieldCount(fields, 1, "D:localPort");
    return ForwardSpec::dynamic(parsePort(fields[1], "local port"));
  }
  if (type == "R") {
    expectFieldCount(fields, 3, "R:remotePort:localHost:localPort");
    uint16_t remotePort = parsePort(fields[1], "remote port");
    string localHost = parseHost(fields[2], "local host");
    uint16_t localPort = parsePort(fields[3], "local port");
    return ForwardSpec::remote(remotePort, localHost, localPort);
  }
  throw TunnelParseException("unknown forward type '" + type +
                             "' (expected L, D or R)");
}
}  // namespace

ForwardSpec ForwardSpec::local(uint16_t localPort, const string& remoteHost,
                               uint16_t remotePort) {
  ForwardSpec spec;
  spec.type = ForwardType::LOCAL;
  spec.localPort = localPort;
  spec.host = remoteHost;
  spec.remotePort = remotePort;
  return spec;
}

ForwardSpec ForwardSpec::dynamic(uint16_t localPort) {
  ForwardSpec spec;
  spec.type = ForwardType::DYNAMIC;
  spec.localPort = localPort;
  return spec;
}

ForwardSpec ForwardSpec::remote(uint16_t remotePort, const string& localHost,
                                uint16_t localPort) {
  ForwardSpec spec;
  spec.type = ForwardType::REMOTE;
  spec.remotePort = remotePort;
  spec.host = localHost;
  spec.localPort = localPort;
  return spec;
}

ForwardParseResult parseForwardSpec(const string& token,
                                    const string& groupName) {
  ForwardParseResult result;
  try {
    result.spec = parseForwardSpecOrThrow(token);
  } catch (const TunnelParseException& tpe) {
    result.error = "group '" + groupName + "': invalid forward spec '" +
                   token + "': " + tpe.what();
  }
  return result;
}

ParsedGroup parseGroupSpecs(const string& groupName,
                            const string& rawSpecText) {
  ParsedGroup group;
  for (const auto& token : splitWhitespace(rawSpecText)) {
    auto result = parseForwardSpec(token, groupName);
    if (result.ok()) {
      group.specs.push_back(*result.spec);
    } else {
      group.errors.push_back(result.error);
    }
  }
  return group;
}

string forwardTypeName(ForwardType type) {
  switch (type) {
    case ForwardType::LOCAL:
      return "Local";
    case ForwardType::DYNAMIC:
      return "SOCKS";
    case ForwardType::REMOTE:
      return "Remote";
  }
  return "Unknown";
}

string describeForwardSpec(const ForwardSpec& spec) {
  switch (spec.type) {
    case ForwardType::LOCAL:
      return "Local  localhost:" + to_string(spec.localPort) + " -> " +
             spec.host + ":" + to_string(spec.remotePort);
    case ForwardType::DYNAMIC:
      return "SOCKS  localhost:" + to_string(spec.localPort);
    case ForwardType::REMOTE:
      return "Remote remote:" + to_string(spec.remotePort) + " -> " +
             spec.host + ":" + to_string(spec.localPort);
  }
  return "Unknown";
}

ostream& operator<<(ostream& os, const ForwardSpec& spec) {
  os << describeForwardSpec(spec);
  return os;
}

}  // namespace sta

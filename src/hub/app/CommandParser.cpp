#include "app/CommandParser.h"

#include <ctype.h>

#include <vector>

namespace {
static bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && isSpace(s[b])) ++b;
  while (e > b && isSpace(s[e - 1])) --e;
  return s.substr(b, e - b);
}

static std::string lower(std::string s) {
  for (size_t i = 0; i < s.size(); ++i) s[i] = (char)tolower((unsigned char)s[i]);
  return s;
}

// Splits off the next whitespace-delimited word; `rest` keeps the remainder.
static bool nextWord(const std::string& in, std::string& word, std::string& rest) {
  size_t b = 0;
  while (b < in.size() && isSpace(in[b])) ++b;
  if (b >= in.size()) return false;
  size_t e = b;
  while (e < in.size() && !isSpace(in[e])) ++e;
  word = in.substr(b, e - b);
  rest = in.substr(e);
  return true;
}

static bool parseIncidentId(const std::string& s, uint32_t& out) {
  if (s.empty() || s.size() > 10) return false;
  uint64_t v = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c < '0' || c > '9') return false;
    v = (v * 10u) + (uint64_t)(c - '0');
  }
  if (v == 0 || v > 0xFFFFFFFFull) return false;
  out = (uint32_t)v;
  return true;
}

static std::vector<std::string> words(const std::string& in) {
  std::vector<std::string> out;
  std::string rest = in;
  std::string w;
  while (nextWord(rest, w, rest)) out.push_back(w);
  return out;
}
} // namespace

CommandError parseCommand(const std::string& line, OperatorCommand& out) {
  out = OperatorCommand();

  std::string verb;
  std::string rest;
  if (!nextWord(line, verb, rest)) return CommandError::empty;
  verb = lower(verb);

  if (verb == "mock") {
    std::string topic;
    if (!nextWord(rest, topic, rest)) return CommandError::missing_argument;
    const std::string body = trim(rest);
    if (body.empty()) return CommandError::missing_argument;
    out.kind = CommandKind::mock;
    out.topic = topic;
    out.body = body;
    return CommandError::none;
  }

  const std::vector<std::string> args = words(rest);

  if (verb == "test") {
    if (args.empty()) return CommandError::missing_argument;
    if (args.size() > 2) return CommandError::bad_argument;
    out.sensor_id = args[0];
    if (args.size() == 2) {
      if (!parseSeverity(lower(args[1]), out.severity)) return CommandError::bad_argument;
      out.has_severity = true;
    }
    out.kind = CommandKind::test;
    return CommandError::none;
  }

  if (verb == "ack") {
    if (args.size() < 2) return CommandError::missing_argument;
    if (args.size() > 2) return CommandError::bad_argument;
    if (!parseIncidentId(args[0], out.incident_id)) return CommandError::bad_argument;
    out.user_id = args[1];
    out.kind = CommandKind::ack;
    return CommandError::none;
  }

  if (verb == "escalate" || verb == "resolve") {
    if (args.empty()) return CommandError::missing_argument;
    if (args.size() > 1) return CommandError::bad_argument;
    if (!parseIncidentId(args[0], out.incident_id)) return CommandError::bad_argument;
    out.kind = (verb == "escalate") ? CommandKind::escalate : CommandKind::resolve;
    return CommandError::none;
  }

  if (verb == "set") {
    if (args.size() < 2) return CommandError::missing_argument;
    if (args.size() > 2) return CommandError::bad_argument;
    out.key = lower(args[0]);
    out.value = args[1];
    out.kind = CommandKind::set;
    return CommandError::none;
  }

  if (verb == "status" || verb == "help" || verb == "?") {
    if (!args.empty()) return CommandError::bad_argument;
    out.kind = (verb == "status") ? CommandKind::status : CommandKind::help;
    return CommandError::none;
  }

  return CommandError::unknown_command;
}

const char* commandHelp() {
  return "mock <topic> <json> | test <sensor> [low|medium|high|critical] | "
         "ack <incident> <user> | escalate <incident> | resolve <incident> | "
         "set <key> <value> | status";
}

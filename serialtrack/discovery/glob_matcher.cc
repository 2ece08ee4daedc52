/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "serialtrack/discovery/glob_matcher.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <cctype>

#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/diagnostics/logger.hpp"

namespace serialtrack {
namespace discovery {

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool is_key_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }

bool is_key_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-'; }

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

[[noreturn]] void fail_parse(const std::string& reason, const std::string& expression, size_t pos) {
  std::string message = "Bad port matcher (" + reason + "):\n  " + expression + "\n  " + std::string(pos, '-') + "^";
  throw diagnostics::MatcherException(message, expression, pos);
}

}  // namespace

GlobMatcher::GlobMatcher(std::string expression) : expression_(std::move(expression)) {
  const std::string& s = expression_;
  const size_t n = s.size();
  size_t pos = 0;

  for (;;) {
    while (pos < n && is_space(s[pos])) ++pos;
    if (pos >= n) break;

    Term term;
    if (s[pos] == '!') {
      term.negated = true;
      ++pos;
    }

    if (pos < n && (is_key_start(s[pos]) || s[pos] == ':')) {
      size_t k = pos;
      while (k < n && is_key_char(s[k])) ++k;
      if (k < n && s[k] == ':') {
        if (k == pos) fail_parse("empty attribute name", s, pos);
        term.key = to_lower(s.substr(pos, k - pos));
        pos = k + 1;
      }
    }

    if (pos < n && (s[pos] == '"' || s[pos] == '\'')) {
      const char quote = s[pos];
      const size_t open = pos++;
      bool closed = false;
      while (pos < n) {
        if (s[pos] == '\\' && pos + 1 < n) {
          // fnmatch understands the escape, keep it as is
          term.pattern += s.substr(pos, 2);
          pos += 2;
        } else if (s[pos] == quote) {
          closed = true;
          ++pos;
          break;
        } else {
          term.pattern += s[pos++];
        }
      }
      if (!closed) fail_parse("unterminated quote", s, open);
      if (pos < n && !is_space(s[pos])) fail_parse("expected whitespace after quote", s, pos);
    } else {
      const size_t start = pos;
      while (pos < n && !is_space(s[pos])) {
        if (s[pos] == '\\') {
          if (pos + 1 >= n) fail_parse("dangling escape", s, pos);
          term.pattern += s.substr(pos, 2);
          pos += 2;
        } else {
          term.pattern += s[pos++];
        }
      }
      if (pos == start) fail_parse("missing pattern", s, pos);
    }

    terms_.push_back(std::move(term));
  }

  SERIALTRACK_LOG_DEBUG("matcher", "parse",
                        expression_.empty() ? std::string("Parsed '' (any port)")
                                            : "Parsed '" + expression_ + "' into " + std::to_string(terms_.size()) +
                                                  " terms");
}

bool GlobMatcher::term_hits(const Term& term, const std::string& key, const std::string& value) {
  if (!term.key.empty() && term.key != to_lower(key)) {
    return false;
  }
  return ::fnmatch(term.pattern.c_str(), value.c_str(), FNM_CASEFOLD) == 0;
}

bool GlobMatcher::matches(const PortInfo& port) const {
  for (const auto& term : terms_) {
    bool hit = std::any_of(port.attr.begin(), port.attr.end(),
                           [&term](const auto& kv) { return term_hits(term, kv.first, kv.second); });
    if (hit == term.negated) {
      return false;
    }
  }
  return true;
}

std::set<std::string> GlobMatcher::matched_keys(const PortInfo& port) const {
  std::set<std::string> keys;
  for (const auto& kv : port.attr) {
    for (const auto& term : terms_) {
      if (!term.negated && term_hits(term, kv.first, kv.second)) {
        keys.insert(kv.first);
        break;
      }
    }
  }
  return keys;
}

}  // namespace discovery
}  // namespace serialtrack

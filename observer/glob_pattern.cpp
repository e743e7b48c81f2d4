#include "glob_pattern.hpp"

#include <sstream>

namespace {
  Error bad_pattern(const std::string& pattern, size_t offset, const std::string& reason) {
    std::ostringstream oss;
    oss << "Malformed glob pattern[" << pattern << "] at offset " << offset << ": " << reason;
    return Error(oss.str());
  }
}

bool observer::GlobPattern::Token::matches(char c) const {
  switch (type) {
    case LITERAL:
      return c == literal;
    case ANY_CHAR:
      return true;
    case ANY_SEQUENCE:
      // Handled by the caller, which decides how many characters to consume.
      return true;
    case CHAR_CLASS: {
      bool found = false;
      for (const std::pair<char, char>& range : ranges) {
        if (c >= range.first && c <= range.second) {
          found = true;
          break;
        }
      }
      return found != negated;
    }
  }
  return false;
}

Try<observer::GlobPattern> observer::GlobPattern::compile(const std::string& pattern) {
  if (pattern.empty()) {
    return bad_pattern(pattern, 0, "pattern is empty");
  }

  std::vector<Token> tokens;
  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    switch (c) {
      case '*':
        // Collapse runs of '*': they're equivalent to a single '*'.
        if (tokens.empty() || tokens.back().type != Token::ANY_SEQUENCE) {
          tokens.push_back(Token(Token::ANY_SEQUENCE));
        }
        break;
      case '?':
        tokens.push_back(Token(Token::ANY_CHAR));
        break;
      case '\\':
        if (i + 1 >= pattern.size()) {
          return bad_pattern(pattern, i, "trailing escape character");
        }
        ++i;
        tokens.push_back(Token(Token::LITERAL, pattern[i]));
        break;
      case '[': {
        size_t class_start = i;
        Token token(Token::CHAR_CLASS);
        ++i;
        if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
          token.negated = true;
          ++i;
        }
        bool closed = false;
        for (; i < pattern.size(); ++i) {
          char lo = pattern[i];
          if (lo == ']') {
            closed = true;
            break;
          }
          if (lo == '\\') {
            if (i + 1 >= pattern.size()) {
              return bad_pattern(pattern, i, "trailing escape character");
            }
            lo = pattern[++i];
          }
          char hi = lo;
          if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            i += 2;
            hi = pattern[i];
            if (hi == '\\') {
              if (i + 1 >= pattern.size()) {
                return bad_pattern(pattern, i, "trailing escape character");
              }
              hi = pattern[++i];
            }
            if (hi < lo) {
              return bad_pattern(pattern, i, "character range is out of order");
            }
          }
          token.ranges.push_back(std::make_pair(lo, hi));
        }
        if (!closed) {
          return bad_pattern(pattern, class_start, "unterminated character class");
        }
        if (token.ranges.empty()) {
          return bad_pattern(pattern, class_start, "empty character class");
        }
        tokens.push_back(token);
        break;
      }
      default:
        tokens.push_back(Token(Token::LITERAL, c));
        break;
    }
  }
  return GlobPattern(pattern, tokens);
}

bool observer::GlobPattern::matches(const std::string& text) const {
  // Iterative matcher with a single backtrack point: on mismatch, let the most recent '*' absorb
  // one more character and retry from there. Every non-'*' token consumes exactly one character,
  // so this never needs to revisit earlier '*'s.
  size_t ti = 0, si = 0;
  size_t star_ti = std::string::npos, star_si = 0;
  while (si < text.size()) {
    if (ti < tokens.size() && tokens[ti].type == Token::ANY_SEQUENCE) {
      star_ti = ti++;
      star_si = si;
    } else if (ti < tokens.size() && tokens[ti].matches(text[si])) {
      ++ti;
      ++si;
    } else if (star_ti != std::string::npos) {
      ti = star_ti + 1;
      si = ++star_si;
    } else {
      return false;
    }
  }
  // Text is exhausted: only trailing '*'s may remain.
  while (ti < tokens.size() && tokens[ti].type == Token::ANY_SEQUENCE) {
    ++ti;
  }
  return ti == tokens.size();
}

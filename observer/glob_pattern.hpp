#pragma once

#include <string>
#include <vector>

#include <stout/try.hpp>

namespace observer {

  /**
   * A shell-style wildcard pattern, compiled once and matched against whole strings.
   *
   * Supported syntax:
   * - '*' matches any sequence of characters (including '/' and the empty sequence)
   * - '?' matches any single character
   * - '[abc]', '[a-z]' match a single character from the set, '[!a-z]' or '[^a-z]' negate it
   * - '\x' matches 'x' literally
   */
  class GlobPattern {
   public:
    /**
     * Compiles the provided pattern, or returns an error describing why the pattern is malformed.
     */
    static Try<GlobPattern> compile(const std::string& pattern);

    /**
     * Returns whether the entirety of the provided text matches this pattern.
     */
    bool matches(const std::string& text) const;

    const std::string& string() const {
      return pattern;
    }

   private:
    class Token {
     public:
      enum Type { LITERAL, ANY_CHAR, ANY_SEQUENCE, CHAR_CLASS };

      Token(Type type, char literal = '\0')
        : type(type), literal(literal), negated(false) { }

      bool matches(char c) const;

      Type type;
      char literal;
      bool negated;
      // Inclusive [first, second] ranges for CHAR_CLASS. Single chars are stored as [c, c].
      std::vector<std::pair<char, char>> ranges;
    };

    GlobPattern(const std::string& pattern, const std::vector<Token>& tokens)
      : pattern(pattern), tokens(tokens) { }

    std::string pattern;
    std::vector<Token> tokens;
  };

}

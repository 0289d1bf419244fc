/**
 * @file ldscript.cpp
 * @brief Linker script MEMORY extraction implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "fwsize/internal/ldscript.hpp"

#include <cctype>
#include <cstddef>
#include <limits>
#include <unordered_map>
#include <utility>

namespace fwsize::internal
{

namespace
{

enum class TokenKind
{
  IDENT,   // Names, keywords, section and file names
  NUMBER,  // Literal including radix prefix and K/M suffix
  STRING,  // Quoted text (quotes stripped)
  PUNCT,   // Any other single character
  END,
};

struct Token
{
  TokenKind kind;
  std::string_view text;
};

bool is_ident_start(char c)
{
  const unsigned char uc = static_cast<unsigned char>(c);
  return std::isalpha(uc) || c == '_' || c == '.' || c == '$';
}

bool is_ident_char(char c)
{
  const unsigned char uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || c == '_' || c == '.' || c == '$';
}

bool tokenize(std::string_view src, std::vector<Token>& out)
{
  size_t i = 0;

  while (i < src.size())
  {
    const char c = src[i];

    if (std::isspace(static_cast<unsigned char>(c)))
    {
      ++i;
      continue;
    }

    // Block comment
    if (c == '/' && i + 1 < src.size() && src[i + 1] == '*')
    {
      const size_t end = src.find("*/", i + 2);
      if (end == std::string_view::npos)
      {
        return false;
      }
      i = end + 2;
      continue;
    }

    if (c == '"')
    {
      const size_t end = src.find('"', i + 1);
      if (end == std::string_view::npos)
      {
        return false;
      }
      out.push_back({TokenKind::STRING, src.substr(i + 1, end - i - 1)});
      i = end + 1;
      continue;
    }

    TokenKind kind = TokenKind::PUNCT;
    size_t len = 1;

    if (std::isdigit(static_cast<unsigned char>(c)))
    {
      kind = TokenKind::NUMBER;
      while (i + len < src.size() && std::isalnum(static_cast<unsigned char>(src[i + len])))
      {
        ++len;
      }
    }
    else if (is_ident_start(c))
    {
      kind = TokenKind::IDENT;
      while (i + len < src.size() && is_ident_char(src[i + len]))
      {
        ++len;
      }
    }

    out.push_back({kind, src.substr(i, len)});
    i += len;
  }

  out.push_back({TokenKind::END, {}});
  return true;
}

/**
 * @brief Recursive-descent walk over a tokenized linker script
 *
 * Top-level commands other than MEMORY and plain symbol assignments are
 * skipped bracket by bracket.
 */
class ScriptParser
{
 public:
  explicit ScriptParser(const std::vector<Token>& tokens)
      : tokens_(tokens), pos_(0), memory_seen_(false)
  {
  }

  bool parse(std::vector<MemoryRegion>& out)
  {
    while (peek().kind != TokenKind::END)
    {
      if (!parse_statement())
      {
        return false;
      }
    }

    out = std::move(first_memory_);
    return true;
  }

 private:
  const Token& peek(size_t ahead = 0) const
  {
    const size_t idx = pos_ + ahead;
    return idx < tokens_.size() ? tokens_[idx] : tokens_.back();
  }

  const Token& next()
  {
    const Token& tok = peek();
    if (tok.kind != TokenKind::END)
    {
      ++pos_;
    }
    return tok;
  }

  bool is_punct(char c, size_t ahead = 0) const
  {
    const Token& tok = peek(ahead);
    return tok.kind == TokenKind::PUNCT && tok.text[0] == c;
  }

  bool accept(char c)
  {
    if (!is_punct(c))
    {
      return false;
    }
    ++pos_;
    return true;
  }

  bool parse_statement()
  {
    const Token& tok = peek();

    if (tok.kind == TokenKind::IDENT && tok.text == "MEMORY" && is_punct('{', 1))
    {
      ++pos_;
      return parse_memory();
    }

    if (tok.kind == TokenKind::IDENT && is_punct('=', 1))
    {
      return parse_assignment();
    }

    if (is_punct('(') || is_punct('{'))
    {
      return skip_balanced();
    }

    if (is_punct(')') || is_punct('}'))
    {
      return false;
    }

    ++pos_;
    return true;
  }

  bool parse_memory()
  {
    if (!accept('{'))
    {
      return false;
    }

    std::vector<MemoryRegion> regions;
    while (!accept('}'))
    {
      MemoryRegion region;
      if (!parse_region(region))
      {
        return false;
      }
      defined_.push_back(region);
      regions.push_back(std::move(region));
    }

    if (!memory_seen_)
    {
      first_memory_ = std::move(regions);
      memory_seen_ = true;
    }
    return true;
  }

  // name [(attrs)] : ORIGIN = expr [,] LENGTH = expr [,]
  bool parse_region(MemoryRegion& region)
  {
    if (peek().kind != TokenKind::IDENT)
    {
      return false;
    }
    region.name = std::string(next().text);

    if (accept('('))
    {
      for (;;)
      {
        const Token& tok = next();
        if (tok.kind == TokenKind::END)
        {
          return false;
        }
        if (tok.kind == TokenKind::PUNCT && tok.text[0] == ')')
        {
          break;
        }
      }
    }

    if (!accept(':'))
    {
      return false;
    }

    bool has_origin = false;
    bool has_length = false;

    while (!has_origin || !has_length)
    {
      const Token& key = peek();
      if (key.kind != TokenKind::IDENT)
      {
        return false;
      }

      uint64_t* value = nullptr;
      bool* seen = nullptr;

      if (key.text == "ORIGIN" || key.text == "org" || key.text == "o")
      {
        value = &region.origin;
        seen = &has_origin;
      }
      else if (key.text == "LENGTH" || key.text == "len" || key.text == "l")
      {
        value = &region.length;
        seen = &has_length;
      }
      else
      {
        return false;
      }

      if (*seen)
      {
        return false;
      }
      ++pos_;

      if (!accept('=') || !parse_expr(*value))
      {
        return false;
      }
      *seen = true;
      accept(',');
    }

    return true;
  }

  // symbol = expr ;
  bool parse_assignment()
  {
    const std::string symbol(next().text);
    ++pos_;  // '='

    const size_t start = pos_;
    uint64_t value = 0;
    if (parse_expr(value) && (is_punct(';') || peek().kind == TokenKind::END))
    {
      symbols_[symbol] = value;
    }
    else
    {
      // Not a constant (e.g. refers to '.'), keep the script walk going
      pos_ = start;
    }

    return skip_statement();
  }

  bool skip_statement()
  {
    while (peek().kind != TokenKind::END)
    {
      if (accept(';'))
      {
        return true;
      }
      if (is_punct('(') || is_punct('{'))
      {
        if (!skip_balanced())
        {
          return false;
        }
        continue;
      }
      if (is_punct(')') || is_punct('}'))
      {
        return false;
      }
      ++pos_;
    }
    return true;
  }

  bool skip_balanced()
  {
    std::vector<char> closers;

    do
    {
      const Token& tok = next();
      if (tok.kind == TokenKind::END)
      {
        return false;
      }
      if (tok.kind != TokenKind::PUNCT)
      {
        continue;
      }

      const char c = tok.text[0];
      if (c == '(' || c == '{')
      {
        closers.push_back(c == '(' ? ')' : '}');
      }
      else if (c == ')' || c == '}')
      {
        if (closers.empty() || closers.back() != c)
        {
          return false;
        }
        closers.pop_back();
      }
    } while (!closers.empty());

    return true;
  }

  /* ----------------------------------------------------------------------- */
  /* Expressions                                                             */
  /* ----------------------------------------------------------------------- */

  bool parse_expr(uint64_t& out)
  {
    if (!parse_term(out))
    {
      return false;
    }

    while (is_punct('+') || is_punct('-'))
    {
      const char op = next().text[0];
      uint64_t rhs = 0;
      if (!parse_term(rhs))
      {
        return false;
      }
      // Addresses and sizes are unsigned; leaving that range is an error
      if (op == '+')
      {
        if (rhs > std::numeric_limits<uint64_t>::max() - out)
        {
          return false;
        }
        out += rhs;
      }
      else
      {
        if (rhs > out)
        {
          return false;
        }
        out -= rhs;
      }
    }
    return true;
  }

  bool parse_term(uint64_t& out)
  {
    if (!parse_unary(out))
    {
      return false;
    }

    while (is_punct('*') || is_punct('/') || is_punct('%'))
    {
      const char op = next().text[0];
      uint64_t rhs = 0;
      if (!parse_unary(rhs))
      {
        return false;
      }

      if (op == '*')
      {
        if (rhs != 0 && out > std::numeric_limits<uint64_t>::max() / rhs)
        {
          return false;
        }
        out *= rhs;
      }
      else if (rhs == 0)
      {
        return false;
      }
      else
      {
        out = op == '/' ? out / rhs : out % rhs;
      }
    }
    return true;
  }

  bool parse_unary(uint64_t& out)
  {
    if (accept('-'))
    {
      if (!parse_unary(out))
      {
        return false;
      }
      return out == 0;
    }
    if (accept('~'))
    {
      if (!parse_unary(out))
      {
        return false;
      }
      out = ~out;
      return true;
    }
    return parse_primary(out);
  }

  bool parse_primary(uint64_t& out)
  {
    if (accept('('))
    {
      return parse_expr(out) && accept(')');
    }

    const Token& tok = peek();

    if (tok.kind == TokenKind::NUMBER)
    {
      ++pos_;
      return parse_number(tok.text, out);
    }

    if (tok.kind != TokenKind::IDENT)
    {
      return false;
    }

    // ORIGIN(region) / LENGTH(region)
    if ((tok.text == "ORIGIN" || tok.text == "LENGTH") && is_punct('(', 1))
    {
      const bool origin = tok.text == "ORIGIN";
      pos_ += 2;

      if (peek().kind != TokenKind::IDENT)
      {
        return false;
      }
      const MemoryRegion* region = find_region(next().text);
      if (region == nullptr || !accept(')'))
      {
        return false;
      }

      out = origin ? region->origin : region->length;
      return true;
    }

    const auto it = symbols_.find(std::string(tok.text));
    if (it == symbols_.end())
    {
      return false;
    }
    ++pos_;
    out = it->second;
    return true;
  }

  const MemoryRegion* find_region(std::string_view name) const
  {
    for (const MemoryRegion& region : defined_)
    {
      if (region.name == name)
      {
        return &region;
      }
    }
    return nullptr;
  }

  const std::vector<Token>& tokens_;
  size_t pos_;

  bool memory_seen_;                                   ///< First MEMORY command done
  std::vector<MemoryRegion> first_memory_;             ///< Regions reported to the caller
  std::vector<MemoryRegion> defined_;                  ///< All regions, for ORIGIN()/LENGTH()
  std::unordered_map<std::string, uint64_t> symbols_;  ///< Constant top-level assignments
};

}  // namespace

bool parse_number(std::string_view token, uint64_t& out)
{
  if (token.empty())
  {
    return false;
  }

  uint64_t multiplier = 1;
  const char suffix = token.back();
  if (suffix == 'K' || suffix == 'k')
  {
    multiplier = 1024;
    token.remove_suffix(1);
  }
  else if (suffix == 'M' || suffix == 'm')
  {
    multiplier = 1024 * 1024;
    token.remove_suffix(1);
  }

  unsigned base = 10;
  if (token.size() > 2 && token[0] == '0' && (token[1] == 'x' || token[1] == 'X'))
  {
    base = 16;
    token.remove_prefix(2);
  }
  else if (token.size() > 1 && token[0] == '0')
  {
    base = 8;
    token.remove_prefix(1);
  }

  if (token.empty())
  {
    return false;
  }

  constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
  uint64_t value = 0;

  for (const char c : token)
  {
    unsigned digit = 0;
    if (c >= '0' && c <= '9')
    {
      digit = static_cast<unsigned>(c - '0');
    }
    else if (c >= 'a' && c <= 'f')
    {
      digit = static_cast<unsigned>(c - 'a' + 10);
    }
    else if (c >= 'A' && c <= 'F')
    {
      digit = static_cast<unsigned>(c - 'A' + 10);
    }
    else
    {
      return false;
    }

    if (digit >= base || value > (max - digit) / base)
    {
      return false;
    }
    value = value * base + digit;
  }

  if (value > max / multiplier)
  {
    return false;
  }

  out = value * multiplier;
  return true;
}

bool parse_memory_regions(std::string_view script, std::vector<MemoryRegion>& out)
{
  std::vector<Token> tokens;
  if (!tokenize(script, tokens))
  {
    return false;
  }

  ScriptParser parser(tokens);
  return parser.parse(out);
}

}  // namespace fwsize::internal

#include "internal/store/filter/filter_expr.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <utility>

namespace mlmeta::store::filter {

namespace {

enum class TokenKind { kIdent, kString, kNumber, kOperator, kLParen, kRParen, kComma, kEnd };

struct Token {
  TokenKind   kind = TokenKind::kEnd;
  std::string text;
  std::size_t offset = 0;
};

std::string Lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

class Lexer {
 public:
  explicit Lexer(std::string_view text) : text_(text) {
  }

  std::vector<Token> Tokenize() {
    std::vector<Token> tokens;
    while (true) {
      SkipSpace();
      if (pos_ >= text_.size()) {
        tokens.push_back({TokenKind::kEnd, "", pos_});
        return tokens;
      }
      tokens.push_back(NextToken());
    }
  }

 private:
  void SkipSpace() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
  }

  [[noreturn]] void Fail(const std::string& what) const {
    throw FilterSyntaxError("filter: " + what + " at offset " + std::to_string(pos_));
  }

  Token NextToken() {
    const std::size_t start = pos_;
    const char        c     = text_[pos_];

    if (c == '(' || c == ')' || c == ',') {
      ++pos_;
      const auto kind = c == '(' ? TokenKind::kLParen : (c == ')' ? TokenKind::kRParen : TokenKind::kComma);
      return Token{kind, std::string(1, c), start};
    }

    if (c == '"' || c == '\'') {
      return Token{TokenKind::kString, ReadString(c), start};
    }

    if (std::isdigit(static_cast<unsigned char>(c)) ||
        ((c == '-' || c == '+') && pos_ + 1 < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_ + 1])))) {
      ++pos_;
      while (pos_ < text_.size()) {
        const char d = text_[pos_];
        const bool exponent_sign = (d == '-' || d == '+') && (text_[pos_ - 1] == 'e' || text_[pos_ - 1] == 'E');
        if (!std::isdigit(static_cast<unsigned char>(d)) && d != '.' && d != 'e' && d != 'E' && !exponent_sign) break;
        ++pos_;
      }
      return Token{TokenKind::kNumber, std::string(text_.substr(start, pos_ - start)), start};
    }

    if (IsIdentStart(c)) {
      while (pos_ < text_.size() && IsIdentChar(text_[pos_])) ++pos_;
      return Token{TokenKind::kIdent, std::string(text_.substr(start, pos_ - start)), start};
    }

    static constexpr std::string_view kTwoChar[] = {"==", "!=", "<=", ">=", "<>"};
    for (auto op : kTwoChar) {
      if (text_.substr(pos_, 2) == op) {
        pos_ += 2;
        return Token{TokenKind::kOperator, std::string(op), start};
      }
    }
    if (c == '=' || c == '<' || c == '>') {
      ++pos_;
      return Token{TokenKind::kOperator, std::string(1, c), start};
    }

    Fail(std::string("unexpected character '") + c + "'");
  }

  std::string ReadString(char quote) {
    ++pos_;
    std::string out;
    while (pos_ < text_.size()) {
      const char c = text_[pos_++];
      if (c == quote) return out;
      if (c == '\\') {
        if (pos_ >= text_.size()) break;
        out.push_back(text_[pos_++]);
        continue;
      }
      out.push_back(c);
    }
    Fail("unterminated string literal");
  }

  std::string_view text_;
  std::size_t      pos_ = 0;
};

class Parser {
 public:
  explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
  }

  FilterExpr ParseAll() {
    auto expr = ParseOr();
    if (Peek().kind != TokenKind::kEnd) {
      Fail("unexpected token '" + Peek().text + "'");
    }
    return expr;
  }

 private:
  const Token& Peek() const {
    return tokens_[pos_];
  }

  Token Take() {
    return tokens_[pos_++];
  }

  bool PeekKeyword(std::string_view keyword) const {
    return Peek().kind == TokenKind::kIdent && Lower(Peek().text) == keyword;
  }

  [[noreturn]] void Fail(const std::string& what) const {
    throw FilterSyntaxError("filter: " + what + " at offset " + std::to_string(Peek().offset));
  }

  Token Expect(TokenKind kind, std::string_view what) {
    if (Peek().kind != kind) {
      Fail("expected " + std::string(what));
    }
    return Take();
  }

  FilterExpr ParseOr() {
    FilterExpr::Or node;
    node.children.push_back(ParseAnd());
    while (PeekKeyword("or")) {
      Take();
      node.children.push_back(ParseAnd());
    }
    if (node.children.size() == 1) return std::move(node.children.front());
    return FilterExpr{std::move(node)};
  }

  FilterExpr ParseAnd() {
    FilterExpr::And node;
    node.children.push_back(ParseUnary());
    while (PeekKeyword("and")) {
      Take();
      node.children.push_back(ParseUnary());
    }
    if (node.children.size() == 1) return std::move(node.children.front());
    return FilterExpr{std::move(node)};
  }

  FilterExpr ParseUnary() {
    if (PeekKeyword("not")) {
      Take();
      FilterExpr::Not node;
      node.children.push_back(ParseUnary());
      return FilterExpr{std::move(node)};
    }
    if (Peek().kind == TokenKind::kLParen) {
      Take();
      auto inner = ParseOr();
      Expect(TokenKind::kRParen, "')'");
      return inner;
    }

    auto ident = Expect(TokenKind::kIdent, "attribute name or function");
    if (Peek().kind == TokenKind::kLParen) {
      return FilterExpr{ParseCall(ident)};
    }
    return FilterExpr{ParseCompare(ident)};
  }

  Call ParseCall(const Token& name) {
    Call call;
    const auto fn = Lower(name.text);
    if (fn == "exists") {
      call.function = Function::kExists;
    } else if (fn == "contains") {
      call.function = Function::kContains;
    } else if (fn == "starts") {
      call.function = Function::kStarts;
    } else if (fn == "ends") {
      call.function = Function::kEnds;
    } else {
      Fail("unknown function '" + name.text + "'");
    }

    Expect(TokenKind::kLParen, "'('");
    call.attribute = Expect(TokenKind::kIdent, "attribute name").text;
    if (call.function != Function::kExists) {
      Expect(TokenKind::kComma, "','");
      call.argument = Expect(TokenKind::kString, "string literal").text;
    }
    Expect(TokenKind::kRParen, "')'");
    return call;
  }

  Compare ParseCompare(const Token& attribute) {
    Compare cmp;
    cmp.attribute = attribute.text;

    const auto op = Expect(TokenKind::kOperator, "comparison operator").text;
    if (op == "==" || op == "=") {
      cmp.op = CompareOp::kEq;
    } else if (op == "!=" || op == "<>") {
      cmp.op = CompareOp::kNe;
    } else if (op == "<") {
      cmp.op = CompareOp::kLt;
    } else if (op == "<=") {
      cmp.op = CompareOp::kLe;
    } else if (op == ">") {
      cmp.op = CompareOp::kGt;
    } else {
      cmp.op = CompareOp::kGe;
    }

    cmp.value = ParseLiteral();
    return cmp;
  }

  Literal ParseLiteral() {
    const auto& tok = Peek();
    if (tok.kind == TokenKind::kString) {
      return Take().text;
    }
    if (tok.kind == TokenKind::kIdent && (Lower(tok.text) == "true" || Lower(tok.text) == "false")) {
      return Lower(Take().text) == "true";
    }
    if (tok.kind == TokenKind::kNumber) {
      const auto text = Take().text;
      if (text.find_first_of(".eE") == std::string::npos) {
        std::int64_t value = 0;
        const char*  begin = text.data() + (text.front() == '+' ? 1 : 0);
        auto [ptr, ec]     = std::from_chars(begin, text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
          return value;
        }
      }
      char*        end   = nullptr;
      const double value = std::strtod(text.c_str(), &end);
      if (end != text.c_str() + text.size()) {
        Fail("malformed number '" + text + "'");
      }
      return value;
    }
    Fail("expected literal");
  }

  std::vector<Token> tokens_;
  std::size_t        pos_ = 0;
};

} // namespace

std::optional<FilterExpr> ParseFilter(std::string_view text) {
  Lexer lexer(text);
  auto  tokens = lexer.Tokenize();
  if (tokens.size() == 1) {
    return std::nullopt;
  }
  Parser parser(std::move(tokens));
  return parser.ParseAll();
}

} // namespace mlmeta::store::filter

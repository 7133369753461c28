#pragma once
#include <string_view>

#include "token.hpp"

/// Splits source text into tokens, one per call to next_token().
/// Never fails: unknown characters come back as token_type::illegal and
/// the end of input is reported as token_type::eof on every further call.
class lexer final
{
  public:
    explicit lexer(std::string_view input);

    auto next_token() -> token;

  private:
    auto read_char() -> void;
    auto skip_whitespace() -> void;
    [[nodiscard]] auto peek_char() const -> std::string_view::value_type;
    auto read_identifier_or_keyword() -> token;
    auto read_number() -> token;
    auto read_illegal() -> token;

    std::string_view m_input;
    std::string_view::size_type m_position {0};
    std::string_view::size_type m_read_position {0};
    std::string_view::value_type m_byte {0};
};

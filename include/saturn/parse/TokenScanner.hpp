#pragma once

#include <QString>
#include <QStringList>
#include <vector>

namespace saturn {
namespace parse {

struct Token
{
    QString text;    // as written
    QString keyword; // lower-cased, for keyword comparison
};

std::vector<Token> scanTokens(const QString &statement);
std::vector<Token> scanTokens(const QStringList &arguments);

class TokenStream
{
public:
    explicit TokenStream(std::vector<Token> tokens);

    bool atEnd() const;
    const Token &peek() const;
    Token next();
    bool nextIs(const QString &keyword) const;
    bool consumeIf(const QString &keyword);

    // Remaining tokens in original case, joined by single spaces.
    QString takeRest();

private:
    std::vector<Token> m_tokens;
    std::size_t m_position = 0;
};

// Placeholder used in error reports when input ends early.
QString endOfInput();

} // namespace parse
} // namespace saturn

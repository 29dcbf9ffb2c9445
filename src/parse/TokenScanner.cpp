#include "saturn/parse/TokenScanner.hpp"

#include <QRegularExpression>

namespace saturn {
namespace parse {

namespace {
const QRegularExpression &whitespace()
{
    static const QRegularExpression pattern(QStringLiteral("\\s+"));
    return pattern;
}

void appendTokens(const QString &text, std::vector<Token> &tokens)
{
    const QStringList parts = text.split(whitespace(), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        tokens.push_back(Token{ part, part.toLower() });
    }
}
} // namespace

std::vector<Token> scanTokens(const QString &statement)
{
    std::vector<Token> tokens;
    appendTokens(statement, tokens);
    return tokens;
}

std::vector<Token> scanTokens(const QStringList &arguments)
{
    std::vector<Token> tokens;
    for (const QString &argument : arguments) {
        appendTokens(argument, tokens);
    }
    return tokens;
}

TokenStream::TokenStream(std::vector<Token> tokens)
    : m_tokens(std::move(tokens))
{
}

bool TokenStream::atEnd() const
{
    return m_position >= m_tokens.size();
}

const Token &TokenStream::peek() const
{
    static const Token empty;
    if (atEnd()) {
        return empty;
    }
    return m_tokens[m_position];
}

Token TokenStream::next()
{
    if (atEnd()) {
        return Token{};
    }
    return m_tokens[m_position++];
}

bool TokenStream::nextIs(const QString &keyword) const
{
    return !atEnd() && m_tokens[m_position].keyword == keyword;
}

bool TokenStream::consumeIf(const QString &keyword)
{
    if (!nextIs(keyword)) {
        return false;
    }
    ++m_position;
    return true;
}

QString TokenStream::takeRest()
{
    QStringList rest;
    while (!atEnd()) {
        rest << m_tokens[m_position++].text;
    }
    return rest.join(QLatin1Char(' '));
}

QString endOfInput()
{
    return QStringLiteral("<end of input>");
}

} // namespace parse
} // namespace saturn

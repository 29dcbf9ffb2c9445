#pragma once

#include <QDateTime>

namespace saturn {
namespace parse {

struct ParseContext
{
    QDateTime now;
    bool use24hTime = false; // disables 12h inference for today's times
};

} // namespace parse
} // namespace saturn

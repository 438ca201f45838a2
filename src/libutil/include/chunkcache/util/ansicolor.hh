#pragma once
///@file

namespace chunkcache {

#define ANSI_NORMAL "\e[0m"
#define ANSI_FAINT "\e[2m"
#define ANSI_RED "\e[31;1m"
#define ANSI_GREEN "\e[32;1m"
#define ANSI_WARNING "\e[35;1m"

} // namespace chunkcache

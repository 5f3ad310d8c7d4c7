#pragma once
///@file

/* Escape sequences used to highlight log prefixes and format
   arguments. */

#define ANSI_NORMAL "\e[0m"
#define ANSI_RED "\e[31;1m"
#define ANSI_GREEN "\e[32;1m"
#define ANSI_WARNING "\e[35;1m"

#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <iostream>

/** Print the usage text, grouped by option category. */
void print_help(const char* prog, std::ostream& os = std::cout);

#endif // HELP_TEXT_HPP

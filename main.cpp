#include "include/CommandLine.hpp"
#include "include/I18n.hpp"
#include <clocale>
#include <iostream>
#include <string>
#include <vector>

#ifndef ORDO_LOCALE_DIR
#define ORDO_LOCALE_DIR "/usr/share/locale"
#endif

int main(const int argc, char **argv) {
    std::setlocale(LC_ALL, "");
    bindtextdomain(ORDO_TEXT_DOMAIN, ORDO_LOCALE_DIR);
    textdomain(ORDO_TEXT_DOMAIN);

    return ordo::CommandLine::execute(std::vector<std::string>(argv + 1, argv + argc), std::cout, std::cerr);
}

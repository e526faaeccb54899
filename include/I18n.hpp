#pragma once
#include <libintl.h>
#include <initializer_list>
#include <string>

#ifndef I18N_GETTEXT_DEFINED
#define _(String) gettext(String)
#define I18N_GETTEXT_DEFINED
#endif

#define ORDO_TEXT_DOMAIN "ordo"

namespace ordo {
    // Replaces each "%s" of an already translated message with the next argument, in order.
    inline std::string fill(const std::string &msg, const std::initializer_list<std::string> args) {
        std::string out;
        auto arg = args.begin();
        std::size_t pos = 0;
        for (std::size_t at; (at = msg.find("%s", pos)) != std::string::npos && arg != args.end(); pos = at + 2) {
            out.append(msg, pos, at - pos);
            out += *arg++;
        }
        out.append(msg, pos, std::string::npos);
        return out;
    }
} // namespace ordo

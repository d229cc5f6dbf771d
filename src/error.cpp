#include "stanza/error.hpp"

namespace Stanza {

    IncludeError IncludeError::make(code c, std::string_view n, std::string_view m) {
        IncludeError e;
        e.errc = c;
        e.name.assign(n.begin(), n.end());
        e.msg.assign(m.begin(), m.end());
        return e;
    }

} // namespace Stanza

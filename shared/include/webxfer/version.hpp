#pragma once

namespace webxfer {

constexpr const char *version() {
    return "0.3.0";
}

}

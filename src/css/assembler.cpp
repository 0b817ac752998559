#include <suture/css/assembler.hpp>

namespace suture::css {

std::string assemble(const std::vector<CssFragment>& fragments) {
    size_t total = 0;
    for (const auto& f : fragments) total += f.text.size() + 1;

    std::string out;
    out.reserve(total);
    for (const auto& f : fragments) {
        out += f.text;
        out += '\n';
    }
    return out;
}

} // namespace suture::css

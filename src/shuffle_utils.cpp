#include "mat_shuffle/shuffle_utils.hpp"
#include <sstream>

namespace mat_shuffle {

std::string gather_direction_to_string(bool gather_forward) {
    return gather_forward ? "forward" : "backward";
}

std::string vec_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << cards[i];
        if (i < cards.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

std::string page_title(const InstructionPage& page, int num_passes, std::size_t pages_in_pass) {
    std::stringstream ss;
    switch (page.kind) {
        case PageKind::BEGIN: ss << "Begin"; break;
        case PageKind::DONE:  ss << "Done"; break;
        case PageKind::DEAL:
            ss << "Pass " << page.pass_index + 1 << "/" << num_passes
               << " - deal " << page.page_index + 1 << "/" << pages_in_pass;
            break;
        case PageKind::GATHER:
            ss << "Pass " << page.pass_index + 1 << "/" << num_passes << " - gather";
            break;
        default: ss << "?"; break;
    }
    return ss.str();
}

std::string pages_to_string(const ShuffleResult& result) {
    std::stringstream ss;
    const int num_passes = static_cast<int>(result.passes.size());
    for (std::size_t i = 0; i < result.pages.size(); ++i) {
        const InstructionPage& page = result.pages[i];
        std::size_t pages_in_pass = 0;
        if (page.pass_index >= 0 && page.pass_index < static_cast<int>(result.mapped_passes.size())) {
            pages_in_pass = result.mapped_passes[page.pass_index].pages.size();
        }
        ss << i << ". " << page_title(page, num_passes, pages_in_pass) << "\n\n" << page.text << "\n";
        if (i + 1 < result.pages.size()) ss << "\n";
    }
    return ss.str();
}

} // namespace mat_shuffle

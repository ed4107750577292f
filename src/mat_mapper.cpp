#include "mat_shuffle/mat_mapper.h"
#include "mat_shuffle/errors.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace mat_shuffle {

namespace {
    // Séparateur entre deux instructions d'une même ligne
    const char* const INSTRUCTION_SPACER = "   ";
}

Mat::Mat(int rows, int columns)
    : rows_(rows), columns_(columns)
{
    if (rows_ < 1 || rows_ > MAX_ROWS) {
        throw ConfigurationOutOfRange("rows", rows_, 1, MAX_ROWS);
    }
    if (columns_ < 1) {
        throw ConfigurationOutOfRange("columns", columns_, 1, std::numeric_limits<int>::max());
    }
    labels_.reserve(static_cast<std::size_t>(rows_) * columns_);
    for (int r = 0; r < rows_; ++r) {
        const char letter = static_cast<char>('A' + r);
        for (int c = 1; c <= columns_; ++c) {
            labels_.push_back(std::string(1, letter) + std::to_string(c));
        }
    }
}

const std::string& Mat::label(std::uint32_t pile) const {
    if (pile >= labels_.size()) {
        throw std::out_of_range("Pile " + std::to_string(pile) + " has no label on a "
                                + std::to_string(labels_.size()) + "-space mat.");
    }
    return labels_[pile];
}

std::vector<std::string> Mat::deal_labels(const PileInstructions& instructions) const {
    if (instructions.get_num_piles() > get_num_piles()) {
        throw std::invalid_argument("Instructions use " + std::to_string(instructions.get_num_piles())
                                    + " piles but the mat only has " + std::to_string(get_num_piles()) + ".");
    }
    std::vector<std::string> out;
    out.reserve(instructions.get_num_instructions());
    for (std::uint32_t pile : instructions.deal_ordered()) {
        out.push_back(labels_[pile]);
    }
    return out;
}

std::string Mat::gather_instruction(bool gather_forward) const {
    std::stringstream ss;
    const std::size_t n = labels_.size();
    if (n == 1) {
        ss << "Pick up the single pile " << labels_[0] << ".";
        return ss.str();
    }

    // En avant: A1 reste en dessous, on pose A2 dessus, puis A3... jusqu'au dernier tas.
    // En arrière: le dernier tas reste en dessous et l'on remonte jusqu'à A1.
    if (gather_forward) {
        ss << "Gather the piles from top left:\n\n"
           << "Place pile " << labels_[1] << " on " << labels_[0] << ".";
        if (n > 2) {
            ss << "\n\nPlace pile " << labels_[2] << " on the " << labels_[0] << "+" << labels_[1] << " pile."
               << "\n\nAnd so on, until " << labels_[n - 1] << " is on top.";
        }
    } else {
        ss << "Gather the piles from bottom right:\n\n"
           << "Place pile " << labels_[n - 2] << " on " << labels_[n - 1] << ".";
        if (n > 2) {
            ss << "\n\nPlace pile " << labels_[n - 3] << " on the " << labels_[n - 1] << "+" << labels_[n - 2] << " pile."
               << "\n\nAnd so on, until " << labels_[0] << " is on top.";
        }
    }
    return ss.str();
}

MappedPass Mat::map_instructions(const PileInstructions& instructions, int pass_index,
                                 std::size_t cards_per_deal, int instructions_per_row) const {
    MappedPass mapped{pass_index, {}, {}};
    mapped.pages = split_by_num_per_deal(deal_labels(instructions), cards_per_deal, instructions_per_row);
    mapped.gather_text = gather_instruction(instructions.gather_forward());
    spdlog::debug("Passe {} projetée sur le tapis: {} page(s), ramassage {}",
                  pass_index, mapped.pages.size(), instructions.gather_forward() ? "en avant" : "en arrière");
    return mapped;
}

std::string Mat::toString() const {
    std::stringstream ss;
    ss << "Mat " << columns_ << "x" << rows_ << ":";
    for (int r = 0; r < rows_; ++r) {
        ss << "\n ";
        for (int c = 0; c < columns_; ++c) {
            ss << " " << labels_[static_cast<std::size_t>(r) * columns_ + c];
        }
    }
    return ss.str();
}

std::vector<DealPage> split_by_num_per_deal(const std::vector<std::string>& deal_labels,
                                            std::size_t cards_per_deal,
                                            int instructions_per_row) {
    if (cards_per_deal == 0) {
        throw std::invalid_argument("cards_per_deal must be > 0");
    }
    if (instructions_per_row <= 0) {
        throw std::invalid_argument("instructions_per_row must be > 0");
    }

    std::vector<DealPage> pages;
    pages.reserve((deal_labels.size() + cards_per_deal - 1) / cards_per_deal);

    for (std::size_t start = 0; start < deal_labels.size(); start += cards_per_deal) {
        const std::size_t end = std::min(start + cards_per_deal, deal_labels.size());
        DealPage page;
        page.labels.assign(deal_labels.begin() + start, deal_labels.begin() + end);

        std::stringstream ss;
        for (std::size_t j = 0; j < page.labels.size(); ++j) {
            if (j > 0) {
                ss << (j % static_cast<std::size_t>(instructions_per_row) == 0 ? "\n" : INSTRUCTION_SPACER);
            }
            ss << page.labels[j];
        }
        page.text = ss.str();
        pages.push_back(std::move(page));
    }
    return pages;
}

} // namespace mat_shuffle

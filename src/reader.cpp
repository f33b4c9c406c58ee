#include "reader.hpp"

namespace httpfile {

std::expected<Whence, FileErrorInfo> whence_from_int(int value) {
    switch (value) {
        case 0: return Whence::Set;
        case 1: return Whence::Current;
        case 2: return Whence::End;
        default:
            return std::unexpected(FileErrorInfo{FileError::InvalidConfig,
                "whence value " + std::to_string(value) + " unsupported"});
    }
}

std::expected<std::vector<std::string>, FileErrorInfo> Reader::read_lines(size_t hint) {
    std::vector<std::string> lines;
    size_t total = 0;
    while (true) {
        auto line = read_line();
        if (!line) return std::unexpected(line.error());
        if (line->empty()) break;
        total += line->size();
        lines.push_back(std::move(*line));
        if (hint > 0 && total >= hint) break;
    }
    return lines;
}

} // namespace httpfile

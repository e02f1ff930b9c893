#pragma once

#include <string>
#include <zlib.h>

namespace vbin {

struct FASTASequence {
    std::string id;           // header up to the first whitespace
    std::string description;
    std::string sequence;
};

/**
 * Streaming FASTA reader. zlib reads plain and gzip-compressed files alike.
 */
class FASTAReader {
public:
    explicit FASTAReader(const std::string& path);
    ~FASTAReader();

    FASTAReader(const FASTAReader&) = delete;
    FASTAReader& operator=(const FASTAReader&) = delete;

    // Fills seq with the next record. Returns false at end of file.
    bool next(FASTASequence& seq);

private:
    bool read_line(std::string& line);

    std::string path_;
    gzFile gz_file_;
    char buffer_[262144];      // 256KB
    std::string pending_header_;
    bool has_pending_header_ = false;
};

}  // namespace vbin

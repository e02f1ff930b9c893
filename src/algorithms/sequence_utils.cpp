#include "sequence_utils.h"

#include <cstring>
#include <stdexcept>

namespace vbin {

FASTAReader::FASTAReader(const std::string& path) : path_(path), gz_file_(nullptr) {
    gz_file_ = gzopen(path.c_str(), "r");
    if (!gz_file_) {
        throw std::runtime_error("Failed to open FASTA file: " + path);
    }
    gzbuffer(gz_file_, 262144);
}

FASTAReader::~FASTAReader() {
    if (gz_file_) {
        gzclose(gz_file_);
    }
}

// Reads one line, joining pieces longer than the buffer, without the line end
bool FASTAReader::read_line(std::string& line) {
    line.clear();
    bool got_any = false;
    while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
        got_any = true;
        size_t len = strlen(buffer_);
        bool complete = len > 0 && buffer_[len - 1] == '\n';
        if (complete) buffer_[--len] = '\0';
        if (len > 0 && buffer_[len - 1] == '\r') buffer_[--len] = '\0';
        line.append(buffer_, len);
        if (complete) return true;
    }
    if (!got_any) {
        int errnum = 0;
        const char* msg = gzerror(gz_file_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw std::runtime_error("Error reading FASTA file " + path_ + ": " + msg);
        }
    }
    return got_any;
}

bool FASTAReader::next(FASTASequence& seq) {
    seq.id.clear();
    seq.description.clear();
    seq.sequence.clear();

    std::string line;
    bool in_sequence = false;

    if (has_pending_header_) {
        line.swap(pending_header_);
        has_pending_header_ = false;
    } else {
        // Skip anything before the first header
        while (true) {
            if (!read_line(line)) return false;
            if (!line.empty() && line[0] == '>') break;
            if (!line.empty()) {
                throw std::runtime_error("FASTA file " + path_ +
                                         " does not start with a '>' header");
            }
        }
    }

    std::string header = line.substr(1);
    size_t space_pos = header.find_first_of(" \t");
    if (space_pos != std::string::npos) {
        seq.id = header.substr(0, space_pos);
        seq.description = header.substr(space_pos + 1);
    } else {
        seq.id = header;
    }
    in_sequence = true;

    while (read_line(line)) {
        if (line.empty()) continue;
        if (line[0] == '>') {
            pending_header_ = line;
            has_pending_header_ = true;
            break;
        }
        seq.sequence += line;
    }

    return in_sequence;
}

}  // namespace vbin

// VBIN - artifact_store.cpp

#include "artifact_store.h"
#include "errors.h"

#include <fcntl.h>
#include <unistd.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace vbin {

namespace fs = std::filesystem;

namespace {

// Flush file contents to stable storage before the rename publishes them
void sync_file(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw std::runtime_error("Cannot reopen artifact for sync: " + path.string());
    }
    int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        throw std::runtime_error("fsync failed for artifact: " + path.string());
    }
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

}  // namespace

ScopedOutputDirectory::ScopedOutputDirectory(const fs::path& dir) : dir_(dir) {
    std::error_code ec;
    // create_directory reports false when the entry already exists, which
    // catches a second run racing for the same directory
    if (!fs::create_directory(dir_, ec)) {
        if (ec) {
            throw PathNotFound("outdir", dir_.string(),
                               "cannot create output directory (" + ec.message() + ")");
        }
        throw PathConflict("outdir", dir_.string());
    }
}

ScopedOutputDirectory::~ScopedOutputDirectory() {
    if (!keep_) {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
}

ArtifactStore::ArtifactStore(fs::path root) : root_(std::move(root)) {}

const char* ArtifactStore::file_name(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::Features: return "tnf.tsv";
        case ArtifactKind::Coverage: return "rpkm.tsv";
        case ArtifactKind::Embedding: return "latent.tsv";
        case ArtifactKind::ModelCheckpoint: return "model.pt";
        case ArtifactKind::ClusterReport: return "clusters.tsv";
        case ArtifactKind::RunLog: return "log.txt";
    }
    return "unknown";
}

const char* ArtifactStore::format_of(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::ModelCheckpoint: return "torch";
        case ArtifactKind::RunLog: return "text";
        default: return "tsv";
    }
}

const char* ArtifactStore::label_of(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::Features: return "features";
        case ArtifactKind::Coverage: return "coverage";
        case ArtifactKind::Embedding: return "embedding";
        case ArtifactKind::ModelCheckpoint: return "model";
        case ArtifactKind::ClusterReport: return "clusters";
        case ArtifactKind::RunLog: return "log";
    }
    return "unknown";
}

fs::path ArtifactStore::path_for(ArtifactKind kind) const {
    return root_ / file_name(kind);
}

ArtifactHandle ArtifactStore::commit(ArtifactKind kind, const Writer& writer) {
    const fs::path final_path = path_for(kind);
    fs::path tmp_path = final_path;
    tmp_path += ".tmp";

    try {
        writer(tmp_path);
        if (!fs::exists(tmp_path)) {
            throw std::runtime_error(std::string("writer produced no ") + label_of(kind) +
                                     " artifact at " + tmp_path.string());
        }
        sync_file(tmp_path);
        fs::rename(tmp_path, final_path);
    } catch (...) {
        remove_quietly(tmp_path);
        throw;
    }

    return {kind, final_path, format_of(kind)};
}

ArtifactHandle ArtifactStore::put(ArtifactKind kind, const Matrix& values,
                                  const std::vector<std::string>& row_labels,
                                  const std::string& column_prefix) {
    if (static_cast<size_t>(values.rows()) != row_labels.size()) {
        throw std::invalid_argument(std::string("Cannot store ") + label_of(kind) + ": " +
                                    std::to_string(values.rows()) + " rows but " +
                                    std::to_string(row_labels.size()) + " labels");
    }

    return commit(kind, [&](const fs::path& path) {
        std::ofstream out(path);
        if (!out) {
            throw std::runtime_error("Cannot open artifact for writing: " + path.string());
        }
        out << "contig";
        for (Eigen::Index c = 0; c < values.cols(); c++) out << "\t" << column_prefix << c;
        out << "\n";

        out << std::setprecision(8);
        for (Eigen::Index r = 0; r < values.rows(); r++) {
            out << row_labels[r];
            for (Eigen::Index c = 0; c < values.cols(); c++) out << "\t" << values(r, c);
            out << "\n";
        }
        out.close();
        if (!out) {
            throw std::runtime_error("Failed writing artifact: " + path.string());
        }
    });
}

MatrixArtifact ArtifactStore::read_matrix(const ArtifactHandle& handle) {
    std::ifstream in(handle.path);
    if (!in) {
        throw std::runtime_error("Cannot open artifact: " + handle.path.string());
    }

    MatrixArtifact artifact;
    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("Artifact has no header: " + handle.path.string());
    }
    {
        std::istringstream header(line);
        std::string field;
        std::getline(header, field, '\t');  // "contig"
        while (std::getline(header, field, '\t')) artifact.column_labels.push_back(field);
    }

    const size_t ncols = artifact.column_labels.size();
    std::vector<float> cells;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        std::istringstream row(line);
        std::string field;
        std::getline(row, field, '\t');
        artifact.row_labels.push_back(field);
        size_t n = 0;
        while (std::getline(row, field, '\t')) {
            try {
                cells.push_back(std::stof(field));
            } catch (const std::exception&) {
                throw std::runtime_error("Malformed value '" + field + "' in artifact " +
                                         handle.path.string());
            }
            n++;
        }
        if (n != ncols) {
            throw std::runtime_error("Row '" + artifact.row_labels.back() + "' has " +
                                     std::to_string(n) + " values, expected " +
                                     std::to_string(ncols) + " in " + handle.path.string());
        }
    }

    artifact.values.resize(static_cast<Eigen::Index>(artifact.row_labels.size()),
                           static_cast<Eigen::Index>(ncols));
    for (size_t i = 0; i < cells.size(); i++) artifact.values.data()[i] = cells[i];
    return artifact;
}

}  // namespace vbin

/**
 * Implementation file for model_repository.h
 */
#include <cstdio>       // std::rename
#include <cstring>      // memcmp, strerror
#include <cerrno>
#include <climits>      // PATH_MAX
#include <cstdint>
#include <cstdlib>      // realpath
#include <fstream>
#include <algorithm>    // sort

#include <sys/stat.h>
#include <unistd.h>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "model_repository.h"
#include "ioutil.h"

using std::string;
using recsvc::ModelRepository;
using recsvc::ModelArtifactError;
using recsvc::RecommenderModel;
using recsvc::FactorizationModel;
using recsvc::FeatureEncoder;
using recsvc::ModelVersion;
using recsvc::IOUtil;
using recsvc::MatrixD;
using recsvc::ColVectorD;
using recsvc::dtype;

const char *const ModelRepository::ENCODERS_FILE   = "encoders.json";
const char *const ModelRepository::EMBEDDINGS_FILE = "embeddings.bin";
const char *const ModelRepository::METADATA_FILE   = "metadata.json";
const char *const ModelRepository::CURRENT_POINTER = "current";

namespace {
    /* Header of embeddings.bin, followed by the user vectors, item vectors,
     * user biases and item biases as packed float32 in the byte order of the
     * writer. byte_order holds BYTE_ORDER_MARK as written by that machine. */
    const char EMBEDDINGS_MAGIC[8] = {'R', 'S', 'V', 'C', 'E', 'M', 'B', '1'};
    const uint32_t FORMAT_VERSION = 1;
    const uint32_t BYTE_ORDER_MARK = 0x01020304;
    const uint32_t SWAPPED_BYTE_ORDER_MARK = 0x04030201;

    struct EmbeddingsHeader {
        char magic[8];
        uint32_t format;
        uint32_t byte_order;
        uint64_t nusers;
        uint64_t nitems;
        uint32_t dim;
        uint32_t reserved;
    };

    string baseName(const string &path) {
        string p = path;
        while (p.size() > 1 && p[p.size() - 1] == '/') {
            p.erase(p.size() - 1);
        }
        size_t slash = p.rfind('/');
        return slash == string::npos ? p : p.substr(slash + 1);
    }

    /* Absolute path with symlinks and "." / ".." resolved, empty if it does not exist */
    string canonicalPath(const string &path) {
        char buf[PATH_MAX];
        if (::realpath(path.c_str(), buf) == nullptr) {
            return "";
        }
        return string(buf);
    }

    string parentDir(const string &path) {
        string p = path;
        while (p.size() > 1 && p[p.size() - 1] == '/') {
            p.erase(p.size() - 1);
        }
        size_t slash = p.rfind('/');
        if (slash == string::npos) return ".";
        if (slash == 0) return "/";
        return p.substr(0, slash);
    }

    const Json::Value& requireMember(const Json::Value &doc, const char *key, const string &file) {
        if (!doc.isObject() || !doc.isMember(key)) {
            throw ModelArtifactError("missing field '" + string(key) + "' in " + file);
        }
        return doc[key];
    }

    int requireInt(const Json::Value &doc, const char *key, const string &file) {
        const Json::Value &v = requireMember(doc, key, file);
        if (!v.isInt() || v.asInt() < 0) {
            throw ModelArtifactError("field '" + string(key) + "' in " + file +
                                     " is not a non-negative integer");
        }
        return v.asInt();
    }

    double requireDouble(const Json::Value &doc, const char *key, const string &file) {
        const Json::Value &v = requireMember(doc, key, file);
        if (!v.isNumeric()) {
            throw ModelArtifactError("field '" + string(key) + "' in " + file + " is not a number");
        }
        return v.asDouble();
    }

    string requireString(const Json::Value &doc, const char *key, const string &file) {
        const Json::Value &v = requireMember(doc, key, file);
        if (!v.isString()) {
            throw ModelArtifactError("field '" + string(key) + "' in " + file + " is not a string");
        }
        return v.asString();
    }

    Json::Value metadataToJson(const ModelVersion &version, dtype globalBias) {
        Json::Value doc(Json::objectValue);
        doc["format_version"] = FORMAT_VERSION;
        doc["version_id"] = version.version_id;
        doc["embedding_dim"] = version.embedding_dim;
        doc["n_users"] = version.n_users;
        doc["n_items"] = version.n_items;
        doc["global_bias"] = static_cast<double>(globalBias);
        doc["trained_at"] = recsvc::toIsoString(version.trained_at);
        doc["dataset"] = version.dataset;
        doc["n_interactions"] = version.n_interactions;
        doc["train_rmse"] = version.train_rmse;
        doc["final_loss"] = version.final_loss;
        return doc;
    }
}


ModelRepository::ModelRepository(const string &rootDir)
    : m_root(rootDir)
{
    IOUtil::makeDirs(m_root);
}

string recsvc::ModelRepository::versionDir(const string &versionId) const {
    return IOUtil::joinPath(m_root, versionId);
}

bool recsvc::ModelRepository::isCompleteVersion(const string &versionDir) {
    return IOUtil::exists(IOUtil::joinPath(versionDir, ENCODERS_FILE)) &&
           IOUtil::exists(IOUtil::joinPath(versionDir, EMBEDDINGS_FILE)) &&
           IOUtil::exists(IOUtil::joinPath(versionDir, METADATA_FILE));
}

void recsvc::ModelRepository::writeEmbeddings(const FactorizationModel &model,
                                              const string &fileName) const
{
    std::ofstream ofs (fileName, std::ofstream::out | std::ofstream::binary | std::ofstream::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to write to file " + fileName);
    }
    EmbeddingsHeader header;
    std::memcpy(header.magic, EMBEDDINGS_MAGIC, sizeof(header.magic));
    header.format = FORMAT_VERSION;
    header.byte_order = BYTE_ORDER_MARK;
    header.reserved = 0;
    header.dim = static_cast<uint32_t>(model.numFactors());
    header.nusers = static_cast<uint64_t>(model.numUsers());
    header.nitems = static_cast<uint64_t>(model.numItems());
    ofs.write(reinterpret_cast<const char *>(&header), sizeof(header));

    // Row-major storage: each embedding is contiguous
    ofs.write(reinterpret_cast<const char *>(model.userVecs().data()),
              sizeof(dtype) * model.userVecs().size());
    ofs.write(reinterpret_cast<const char *>(model.itemVecs().data()),
              sizeof(dtype) * model.itemVecs().size());
    ofs.write(reinterpret_cast<const char *>(model.userBias().data()),
              sizeof(dtype) * model.userBias().size());
    ofs.write(reinterpret_cast<const char *>(model.itemBias().data()),
              sizeof(dtype) * model.itemBias().size());
    ofs.close();
    if (!ofs) {
        throw std::runtime_error("Failed to write to file " + fileName);
    }
    IOUtil::syncPath(fileName);
}

FactorizationModel recsvc::ModelRepository::readEmbeddings(const string &fileName,
                                                           dtype globalBias) const
{
    std::ifstream ifs (fileName, std::ifstream::in | std::ifstream::binary);
    if (!ifs.is_open()) {
        throw ModelArtifactError("Failed to read from file " + fileName);
    }
    EmbeddingsHeader header;
    if (!ifs.read(reinterpret_cast<char *>(&header), sizeof(header)) ||
        std::memcmp(header.magic, EMBEDDINGS_MAGIC, sizeof(header.magic)) != 0) {
        throw ModelArtifactError("bad embeddings header in " + fileName);
    }
    if (header.byte_order != BYTE_ORDER_MARK) {
        throw ModelArtifactError(header.byte_order == SWAPPED_BYTE_ORDER_MARK
                                 ? "embeddings file " + fileName + " was written with a different byte order"
                                 : "bad byte order mark in " + fileName);
    }
    if (header.format != FORMAT_VERSION) {
        throw ModelArtifactError("unsupported embeddings format " + std::to_string(header.format) +
                                 " in " + fileName);
    }
    if (header.dim == 0 || header.nusers > INT_MAX || header.nitems > INT_MAX) {
        throw ModelArtifactError("bad embeddings dimensions in " + fileName);
    }

    const uint64_t expected = sizeof(header) + sizeof(dtype) *
        ((header.nusers + header.nitems) * header.dim + header.nusers + header.nitems);
    ifs.seekg(0, std::ifstream::end);
    const uint64_t actual = static_cast<uint64_t>(ifs.tellg());
    if (actual != expected) {
        throw ModelArtifactError("embeddings file " + fileName + " has " + std::to_string(actual) +
                                 " bytes, expected " + std::to_string(expected));
    }
    ifs.seekg(sizeof(header), std::ifstream::beg);

    const int dim = static_cast<int>(header.dim);
    const int nusers = static_cast<int>(header.nusers);
    const int nitems = static_cast<int>(header.nitems);
    MatrixD userVecs(nusers, dim);
    MatrixD itemVecs(nitems, dim);
    ColVectorD userBias(nusers);
    ColVectorD itemBias(nitems);
    ifs.read(reinterpret_cast<char *>(userVecs.data()), sizeof(dtype) * userVecs.size());
    ifs.read(reinterpret_cast<char *>(itemVecs.data()), sizeof(dtype) * itemVecs.size());
    ifs.read(reinterpret_cast<char *>(userBias.data()), sizeof(dtype) * userBias.size());
    ifs.read(reinterpret_cast<char *>(itemBias.data()), sizeof(dtype) * itemBias.size());
    if (!ifs) {
        throw ModelArtifactError("truncated embeddings file " + fileName);
    }
    try {
        return FactorizationModel(globalBias, userVecs, itemVecs, userBias, itemBias);
    } catch (const std::invalid_argument &e) {
        throw ModelArtifactError(fileName + ": " + e.what());
    }
}

void recsvc::ModelRepository::save(RecommenderModel &model, const string &versionDir) {
    if (IOUtil::exists(versionDir)) {
        throw std::runtime_error("Version directory " + versionDir + " already exists");
    }
    const string staging = IOUtil::joinPath(parentDir(versionDir), "." + baseName(versionDir) + ".staging");
    IOUtil::removeAll(staging);
    IOUtil::makeDirs(staging);

    try {
        // Artifacts are written one at a time so only one serialized copy is in memory.
        Json::Value encoders(Json::objectValue);
        encoders["users"] = model.users().toJson();
        encoders["items"] = model.items().toJson();
        IOUtil::writeJson(IOUtil::joinPath(staging, ENCODERS_FILE), encoders);

        writeEmbeddings(model.model(), IOUtil::joinPath(staging, EMBEDDINGS_FILE));

        IOUtil::writeJson(IOUtil::joinPath(staging, METADATA_FILE),
                          metadataToJson(model.version(), model.model().globalBias()));

        IOUtil::syncPath(staging);
        if (std::rename(staging.c_str(), versionDir.c_str()) != 0) {
            throw std::runtime_error("Failed to move " + staging + " to " + versionDir + ": " +
                                     std::strerror(errno));
        }
    } catch (...) {
        IOUtil::removeAll(staging);
        throw;
    }
    IOUtil::syncPath(parentDir(versionDir));
    model.setPath(versionDir);
    spdlog::info("Model {} saved to {}", model.version().version_id, versionDir);
}

string recsvc::ModelRepository::save(RecommenderModel &model) {
    string dir = versionDir(model.version().version_id);
    save(model, dir);
    return dir;
}

void recsvc::ModelRepository::promote(const string &versionDir) {
    const string resolved = canonicalPath(versionDir);
    if (resolved.empty() || !isCompleteVersion(resolved)) {
        throw ModelArtifactError("Cannot promote incomplete version " + versionDir);
    }
    // Versions inside the repository are referenced relatively, so the
    // repository directory can be moved as a whole.
    string target = resolved;
    if (parentDir(resolved) == canonicalPath(m_root)) {
        target = baseName(resolved);
    }

    std::lock_guard<std::mutex> lock(m_promoteMutex);
    const string pointer = IOUtil::joinPath(m_root, CURRENT_POINTER);
    const string tmpPointer = IOUtil::joinPath(m_root, "." + string(CURRENT_POINTER) + ".tmp." +
                                               std::to_string(::getpid()));
    ::unlink(tmpPointer.c_str());
    if (::symlink(target.c_str(), tmpPointer.c_str()) != 0) {
        throw std::runtime_error("Failed to create pointer " + tmpPointer + ": " + std::strerror(errno));
    }
    // The new pointer lives beside the old one, so it resolves the same way after the rename
    if (!isCompleteVersion(tmpPointer)) {
        ::unlink(tmpPointer.c_str());
        throw ModelArtifactError("Pointer to " + versionDir + " does not resolve to a complete version");
    }
    if (std::rename(tmpPointer.c_str(), pointer.c_str()) != 0) {
        int err = errno;
        ::unlink(tmpPointer.c_str());
        throw std::runtime_error("Failed to replace pointer " + pointer + ": " + std::strerror(err));
    }
    IOUtil::syncPath(m_root);
    spdlog::info("Promoted {} to current", resolved);
}

string recsvc::ModelRepository::currentDir() const {
    const string pointer = IOUtil::joinPath(m_root, CURRENT_POINTER);
    char buf[PATH_MAX];
    ssize_t len = ::readlink(pointer.c_str(), buf, sizeof(buf) - 1);
    if (len < 0) {
        return "";
    }
    buf[len] = '\0';
    string target(buf);
    if (!target.empty() && target[0] == '/') {
        return target;
    }
    return IOUtil::joinPath(m_root, target);
}

string recsvc::ModelRepository::currentVersionId() const {
    string dir = currentDir();
    return dir.empty() ? dir : baseName(dir);
}

std::shared_ptr<RecommenderModel> recsvc::ModelRepository::current() const {
    string dir = currentDir();
    if (dir.empty()) {
        return std::shared_ptr<RecommenderModel>();
    }
    return load(dir);
}

ModelVersion recsvc::ModelRepository::parseMetadata(const string &metadataFile, dtype &globalBias) const {
    Json::Value metadata;
    try {
        metadata = IOUtil::readJson(metadataFile);
    } catch (const std::runtime_error &e) {
        throw ModelArtifactError(e.what());
    }

    ModelVersion version;
    version.version_id = requireString(metadata, "version_id", metadataFile);
    version.embedding_dim = requireInt(metadata, "embedding_dim", metadataFile);
    version.n_users = requireInt(metadata, "n_users", metadataFile);
    version.n_items = requireInt(metadata, "n_items", metadataFile);
    globalBias = static_cast<dtype>(requireDouble(metadata, "global_bias", metadataFile));
    const string trainedAt = requireString(metadata, "trained_at", metadataFile);
    try {
        version.trained_at = parseIsoString(trainedAt);
    } catch (const std::runtime_error &e) {
        throw ModelArtifactError(metadataFile + ": " + e.what());
    }
    version.dataset = metadata.get("dataset", Json::Value("")).asString();
    version.n_interactions = metadata.get("n_interactions", Json::Value(0)).asInt();
    version.train_rmse = metadata.get("train_rmse", Json::Value(0.0)).asDouble();
    version.final_loss = metadata.get("final_loss", Json::Value(0.0)).asDouble();
    return version;
}

ModelVersion recsvc::ModelRepository::readMetadata(const string &versionDir) const {
    const string metadataFile = IOUtil::joinPath(versionDir, METADATA_FILE);
    if (!IOUtil::exists(metadataFile)) {
        throw ModelArtifactError("Missing model artifact " + metadataFile);
    }
    dtype globalBias = 0;
    ModelVersion version = parseMetadata(metadataFile, globalBias);
    version.path = versionDir;
    return version;
}

std::shared_ptr<RecommenderModel> recsvc::ModelRepository::load(const string &versionDir) const {
    const string encodersFile = IOUtil::joinPath(versionDir, ENCODERS_FILE);
    const string embeddingsFile = IOUtil::joinPath(versionDir, EMBEDDINGS_FILE);
    const string metadataFile = IOUtil::joinPath(versionDir, METADATA_FILE);
    for (const string &f : {encodersFile, embeddingsFile, metadataFile}) {
        if (!IOUtil::exists(f)) {
            throw ModelArtifactError("Missing model artifact " + f);
        }
    }

    dtype globalBias = 0;
    ModelVersion version = parseMetadata(metadataFile, globalBias);
    version.path = versionDir;

    Json::Value encoders;
    try {
        encoders = IOUtil::readJson(encodersFile);
    } catch (const std::runtime_error &e) {
        throw ModelArtifactError(e.what());
    }

    FeatureEncoder users;
    FeatureEncoder items;
    try {
        users = FeatureEncoder::fromJson(requireMember(encoders, "users", encodersFile));
        items = FeatureEncoder::fromJson(requireMember(encoders, "items", encodersFile));
    } catch (const ModelArtifactError &) {
        throw;
    } catch (const std::runtime_error &e) {
        throw ModelArtifactError(encodersFile + ": " + e.what());
    }

    FactorizationModel model = readEmbeddings(embeddingsFile, globalBias);

    if (model.numFactors() != version.embedding_dim ||
        model.numUsers() != version.n_users || model.numItems() != version.n_items ||
        users.size() != version.n_users || items.size() != version.n_items) {
        throw ModelArtifactError("Inconsistent dimensions between the artifacts of " + versionDir);
    }
    try {
        return std::make_shared<RecommenderModel>(version, users, items, model);
    } catch (const std::invalid_argument &e) {
        throw ModelArtifactError(versionDir + ": " + e.what());
    }
}

std::vector<string> recsvc::ModelRepository::listVersions() const {
    std::vector<string> versions;
    for (const string &entry : IOUtil::listDirectory(m_root)) {
        if (entry.empty() || entry[0] == '.' || entry == CURRENT_POINTER) {
            continue;
        }
        string dir = IOUtil::joinPath(m_root, entry);
        if (IOUtil::isDirectory(dir) && isCompleteVersion(dir)) {
            versions.push_back(entry);
        }
    }
    std::sort(versions.begin(), versions.end());
    return versions;
}

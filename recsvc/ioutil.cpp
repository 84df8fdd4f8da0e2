/**
 * Implementation of ioutil.h
 */
#include <cstdio>     // std::rename, std::remove, sscanf
#include <cstring>    // strerror
#include <cerrno>
#include <ctime>
#include <random>     // std::mt19937_64
#include <fstream>    // std::ifstream, std::ofstream
#include <sstream>
#include <memory>
#include <stdexcept>  // std::runtime_error

#include <dirent.h>
#include <fcntl.h>    // open
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "ioutil.h"

using std::string;
using std::vector;
using recsvc::Interaction;
using recsvc::ContentItem;
using recsvc::IOUtil;

namespace {
    vector<string> splitCsv(const string &line) {
        vector<string> fields;
        std::stringstream ss(line);
        string field;
        while (std::getline(ss, field, ',')) {
            fields.push_back(field);
        }
        return fields;
    }

    string systemError(const string &what, const string &path) {
        return what + " " + path + ": " + std::strerror(errno);
    }
}

Interaction recsvc::IOUtil::readInteractionLine(const string &line) {
    // Sample line:
    // u42,m1193,5,978300760
    vector<string> fields = splitCsv(line);
    if (fields.size() < 3) {
        throw std::invalid_argument("expected at least 3 fields");
    }
    Interaction result;
    result.user_id = fields[0];
    result.content_id = fields[1];
    result.value = std::stof(fields[2]);
    result.timestamp = fields.size() > 3 ? std::stoll(fields[3]) : 0;
    return result;
}

ContentItem recsvc::IOUtil::readCatalogLine(const string &line) {
    vector<string> fields = splitCsv(line);
    if (fields.empty() || fields[0].empty()) {
        throw std::invalid_argument("missing content id");
    }
    ContentItem item;
    item.content_id = fields[0];
    item.popularity_score = fields.size() > 1 ? std::stod(fields[1]) : 0.0;
    return item;
}

vector<Interaction> recsvc::IOUtil::readInteractions(const string &fileName) {
    vector<Interaction> interactions;

    std::ifstream fh (fileName, std::ifstream::in);
    if (!fh.is_open()) {
        throw std::runtime_error("Failed to read from file " + fileName);
    }
    string line;
    int lineNo = 1;
    // Skip first line ("user_id,content_id,value,timestamp")
    std::getline(fh, line);
    while (std::getline(fh, line)) {
        lineNo++;
        if (line.empty()) continue;
        try {
            interactions.push_back(readInteractionLine(line));
        } catch (const std::exception &e) {
            throw std::runtime_error("Malformed interaction at " + fileName + ":" +
                                     std::to_string(lineNo) + " (" + e.what() + ")");
        }
    }
    return interactions;
}

vector<ContentItem> recsvc::IOUtil::readCatalog(const string &fileName) {
    vector<ContentItem> items;

    std::ifstream fh (fileName, std::ifstream::in);
    if (!fh.is_open()) {
        throw std::runtime_error("Failed to read from file " + fileName);
    }
    string line;
    int lineNo = 1;
    // Skip first line ("content_id,popularity_score")
    std::getline(fh, line);
    while (std::getline(fh, line)) {
        lineNo++;
        if (line.empty()) continue;
        try {
            items.push_back(readCatalogLine(line));
        } catch (const std::exception &e) {
            throw std::runtime_error("Malformed catalog entry at " + fileName + ":" +
                                     std::to_string(lineNo) + " (" + e.what() + ")");
        }
    }
    return items;
}

Json::Value recsvc::IOUtil::readJson(const string &fileName) {
    std::ifstream fh (fileName, std::ifstream::in);
    if (!fh.is_open()) {
        throw std::runtime_error("Failed to read from file " + fileName);
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, fh, &root, &errs)) {
        throw std::runtime_error("Failed to parse JSON in " + fileName + ": " + errs);
    }
    return root;
}

void recsvc::IOUtil::writeJson(const string &fileName, const Json::Value &doc) {
    const string tmpName = fileName + ".tmp";
    {
        std::ofstream ofs (tmpName, std::ofstream::out | std::ofstream::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to write to file " + tmpName);
        }
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(doc, &ofs);
        ofs << "\n";
        ofs.close();
        if (!ofs) {
            throw std::runtime_error("Failed to write to file " + tmpName);
        }
    }
    syncPath(tmpName);
    if (std::rename(tmpName.c_str(), fileName.c_str()) != 0) {
        std::remove(tmpName.c_str());
        throw std::runtime_error(systemError("Failed to rename", tmpName));
    }
}

void recsvc::IOUtil::syncPath(const string &path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw std::runtime_error(systemError("Failed to open", path));
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        errno = err;
        throw std::runtime_error(systemError("Failed to sync", path));
    }
    ::close(fd);
}

bool recsvc::IOUtil::exists(const string &path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

bool recsvc::IOUtil::isDirectory(const string &path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

void recsvc::IOUtil::makeDirs(const string &path) {
    if (path.empty()) return;
    string partial;
    size_t pos = 0;
    while (pos != string::npos) {
        pos = path.find('/', pos + 1);
        partial = path.substr(0, pos);
        if (partial.empty() || isDirectory(partial)) continue;
        if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            throw std::runtime_error(systemError("Failed to create directory", partial));
        }
    }
}

void recsvc::IOUtil::removeAll(const string &path) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) {
        return;
    }
    if (S_ISDIR(st.st_mode)) {
        for (const string &entry : listDirectory(path)) {
            removeAll(joinPath(path, entry));
        }
        if (::rmdir(path.c_str()) != 0) {
            throw std::runtime_error(systemError("Failed to remove directory", path));
        }
    } else if (::unlink(path.c_str()) != 0) {
        throw std::runtime_error(systemError("Failed to remove", path));
    }
}

vector<string> recsvc::IOUtil::listDirectory(const string &path) {
    vector<string> entries;
    DIR *dir = ::opendir(path.c_str());
    if (dir == nullptr) {
        throw std::runtime_error(systemError("Failed to open directory", path));
    }
    struct dirent *ent;
    while ((ent = ::readdir(dir)) != nullptr) {
        string name = ent->d_name;
        if (name != "." && name != "..") {
            entries.push_back(name);
        }
    }
    ::closedir(dir);
    return entries;
}

string recsvc::IOUtil::joinPath(const string &a, const string &b) {
    if (a.empty()) return b;
    if (a[a.size() - 1] == '/') return a + b;
    return a + "/" + b;
}


string recsvc::toIsoString(const TimePoint &tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return string(buf);
}

recsvc::TimePoint recsvc::parseIsoString(const string &s) {
    std::tm tm = {};
    if (sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
               &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        throw std::runtime_error("Malformed timestamp '" + s + "'");
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return Clock::from_time_t(timegm(&tm));
}

string recsvc::generateUuid() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);
    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return string(buf);
}

#ifndef __RECSVC_IOUTIL_H
#define __RECSVC_IOUTIL_H

#include <string>
#include <vector>
#include <cstdint>      // int64_t

#include <chrono>       // time measurements

#include <json/json.h>

#include "rec_types.h"

namespace recsvc {
    /*
     * Static class for reading data from file, and writing to file.
     * All functions throw std::runtime_error when a file cannot be read or written.
     */
    class IOUtil
    {
        private:
            IOUtil();
            static Interaction readInteractionLine(const std::string &line);
            static ContentItem readCatalogLine(const std::string &line);
        public:
            /*
             * Read interactions from a CSV file with header
             * "user_id,content_id,value,timestamp".
             */
            static std::vector<Interaction> readInteractions(const std::string &fileName);

            /*
             * Read the content catalog from a CSV file with header
             * "content_id,popularity_score".
             */
            static std::vector<ContentItem> readCatalog(const std::string &fileName);

            static Json::Value readJson(const std::string &fileName);

            /*
             * Write a JSON document. The document is written to a temporary file
             * first and renamed into place, so readers never see half a document.
             */
            static void writeJson(const std::string &fileName, const Json::Value &doc);

            /* fsync a file or directory, so a rename that follows survives a power loss */
            static void syncPath(const std::string &path);

            static bool exists(const std::string &path);
            static bool isDirectory(const std::string &path);
            /* mkdir -p */
            static void makeDirs(const std::string &path);
            /* rm -r, used to discard staging directories */
            static void removeAll(const std::string &path);
            static std::vector<std::string> listDirectory(const std::string &path);
            static std::string joinPath(const std::string &a, const std::string &b);
    };

    /*
     * Following functions are utilities for displaying elapsed time or current time.
     */

    double inline elapsed(std::chrono::time_point<std::chrono::high_resolution_clock> start)
    {
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;
        return elapsed.count();
    }

    /* ISO-8601 UTC representation ("2024-05-01T12:00:00Z") of a time point */
    std::string toIsoString(const TimePoint &tp);

    /* Inverse of toIsoString. Throws std::runtime_error on malformed input. */
    TimePoint parseIsoString(const std::string &s);

    /* Random (version 4) UUID in its canonical textual form */
    std::string generateUuid();
}

#endif

/**
 * Persistence of trained model versions and promotion of one version to "current".
 *
 * On-disk layout:
 *      <root>/<version_id>/encoders.json     user and content id lists, in index order
 *      <root>/<version_id>/embeddings.bin    packed float32 vectors and biases
 *      <root>/<version_id>/metadata.json     ModelVersion fields and the global bias
 *      <root>/current -> <version_id>        symlink to the served version
 *
 * A version directory is written under a staging name and renamed into place, so it
 * is either complete or absent. Promotion writes a new symlink next to `current` and
 * renames it over the old one, which replaces the pointer in a single step.
 * Superseded versions are kept.
 */
#ifndef __RECSVC_MODEL_REPOSITORY_H
#define __RECSVC_MODEL_REPOSITORY_H

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <stdexcept>

#include "recommender_model.h"

namespace recsvc {
    /*
     * A persisted version is missing one of its artifacts, cannot be parsed or is
     * internally inconsistent. Callers may fall back to popularity ranking.
     */
    class ModelArtifactError : public std::runtime_error {
    public:
        explicit ModelArtifactError(const std::string &what) : std::runtime_error(what) {}
    };

    class ModelRepository {
    public:
        static const char *const ENCODERS_FILE;
        static const char *const EMBEDDINGS_FILE;
        static const char *const METADATA_FILE;
        static const char *const CURRENT_POINTER;

        explicit ModelRepository(const std::string &rootDir);

        const std::string& root() const { return m_root; }

        /* Default directory of a version inside the repository */
        std::string versionDir(const std::string &versionId) const;

        /*
         * Write the three artifacts of `model` into `versionDir`, which must not exist yet.
         * Throws std::runtime_error on I/O failure; nothing is left behind in that case.
         */
        void save(RecommenderModel &model, const std::string &versionDir);

        /* Save into versionDir(model.version().version_id) and return that directory */
        std::string save(RecommenderModel &model);

        /*
         * Make `versionDir` the current version. Throws ModelArtifactError if the
         * version is incomplete and std::runtime_error if the pointer cannot be replaced.
         */
        void promote(const std::string &versionDir);

        /* Metadata of the version in `versionDir` without loading its arrays. Throws ModelArtifactError */
        ModelVersion readMetadata(const std::string &versionDir) const;

        /* Throws ModelArtifactError; never returns a partially initialised model */
        std::shared_ptr<RecommenderModel> load(const std::string &versionDir) const;

        /*
         * Load the current version, or return nullptr if no version was promoted yet.
         * Throws ModelArtifactError if the pointer is dangling or the version is corrupt.
         */
        std::shared_ptr<RecommenderModel> current() const;

        /* Directory the current pointer refers to, or "" if there is no pointer */
        std::string currentDir() const;

        /* Version id (directory name) of the current version, or "" if there is no pointer */
        std::string currentVersionId() const;

        bool hasCurrent() const {
            return !currentDir().empty();
        }

        /* Ids of all complete versions, sorted */
        std::vector<std::string> listVersions() const;

        /* True if all three artifacts are present in `versionDir` */
        static bool isCompleteVersion(const std::string &versionDir);

    private:
        std::string m_root;
        std::mutex m_promoteMutex;

        ModelVersion parseMetadata(const std::string &metadataFile, dtype &globalBias) const;
        void writeEmbeddings(const FactorizationModel &model, const std::string &fileName) const;
        FactorizationModel readEmbeddings(const std::string &fileName, dtype globalBias) const;
    };
}

#endif

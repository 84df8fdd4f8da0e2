/**
 * Contracts of the external collaborators around the recommender: the interaction
 * store (read side), the new-interaction counter and the content catalog.
 *
 * The in-memory implementations below (filled from CSV files by IOUtil) back the
 * command line tool and the tests; a deployment plugs its own implementations in.
 */
#ifndef __RECSVC_INTERACTION_STORE_H
#define __RECSVC_INTERACTION_STORE_H

#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <cstddef>
#include <cstdint>

#include "rec_types.h"

namespace recsvc {

    class InteractionSource {
    public:
        virtual ~InteractionSource() {}
        /* At most `limit` interactions, most recent first */
        virtual std::vector<Interaction> queryRecent(size_t limit) const = 0;
        /* Content ids the user interacted with, in no particular order */
        virtual std::vector<std::string> contentForUser(const std::string &userId) const = 0;
    };

    /* Counter of interactions recorded since the last successful retraining */
    class InteractionCounter {
    public:
        virtual ~InteractionCounter() {}
        virtual void increment() = 0;
        virtual int64_t get() const = 0;
        virtual void reset() = 0;
    };

    class ContentCatalog {
    public:
        virtual ~ContentCatalog() {}
        /* All known content items, in catalog order */
        virtual std::vector<ContentItem> items() const = 0;
    };

    /**
     * Thread-safe in-memory interaction store. Recording an interaction also
     * increments the attached counter, if any.
     */
    class MemoryInteractionStore : public InteractionSource {
    public:
        explicit MemoryInteractionStore(InteractionCounter *counter = nullptr)
            : m_counter(counter) {}

        void record(const Interaction &interaction);
        void recordAll(const std::vector<Interaction> &interactions);
        size_t size() const;

        std::vector<Interaction> queryRecent(size_t limit) const override;
        std::vector<std::string> contentForUser(const std::string &userId) const override;

    private:
        mutable std::mutex m_mutex;
        std::vector<Interaction> m_interactions;
        InteractionCounter *m_counter;
    };

    class MemoryInteractionCounter : public InteractionCounter {
    public:
        MemoryInteractionCounter() : m_count(0) {}

        void increment() override { m_count.fetch_add(1); }
        int64_t get() const override { return m_count.load(); }
        void reset() override { m_count.store(0); }

    private:
        std::atomic<int64_t> m_count;
    };

    class MemoryContentCatalog : public ContentCatalog {
    public:
        MemoryContentCatalog() {}
        explicit MemoryContentCatalog(const std::vector<ContentItem> &items)
            : m_items(items) {}

        void add(const ContentItem &item);
        std::vector<ContentItem> items() const override;

    private:
        mutable std::mutex m_mutex;
        std::vector<ContentItem> m_items;
    };
}

#endif

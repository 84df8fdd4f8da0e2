/**
 * Implementation file for interaction_store.h
 */
#include <algorithm>    // stable_sort, min

#include "interaction_store.h"

using std::string;
using std::vector;
using recsvc::Interaction;
using recsvc::ContentItem;

void recsvc::MemoryInteractionStore::record(const Interaction &interaction) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interactions.push_back(interaction);
    }
    if (m_counter != nullptr) {
        m_counter->increment();
    }
}

void recsvc::MemoryInteractionStore::recordAll(const vector<Interaction> &interactions) {
    for (const Interaction &interaction : interactions) {
        record(interaction);
    }
}

size_t recsvc::MemoryInteractionStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_interactions.size();
}

vector<Interaction> recsvc::MemoryInteractionStore::queryRecent(size_t limit) const {
    vector<Interaction> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        result = m_interactions;
    }
    // Later records win ties, so equal timestamps are returned newest-recorded first
    std::reverse(result.begin(), result.end());
    std::stable_sort(result.begin(), result.end(),
                     [](const Interaction &a, const Interaction &b) {
                         return a.timestamp > b.timestamp;
                     });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

vector<string> recsvc::MemoryInteractionStore::contentForUser(const string &userId) const {
    vector<string> content;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const Interaction &interaction : m_interactions) {
        if (interaction.user_id == userId) {
            content.push_back(interaction.content_id);
        }
    }
    return content;
}

void recsvc::MemoryContentCatalog::add(const ContentItem &item) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_items.push_back(item);
}

vector<ContentItem> recsvc::MemoryContentCatalog::items() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items;
}

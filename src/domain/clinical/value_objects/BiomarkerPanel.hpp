/**
 * @file BiomarkerPanel.hpp
 * @brief Value Object holding biomarker readings in the order they were reported.
 */

#pragma once

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace trialguard::domain::clinical {

/**
 * @class BiomarkerPanel
 * @brief Marker name -> free-text value, e.g. "HER2" -> "positive".
 *
 * Iteration follows first insertion. Setting a name that is already present
 * replaces its value in place, so repeated writes are last-write-wins.
 */
class BiomarkerPanel {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    BiomarkerPanel() = default;

    BiomarkerPanel(std::initializer_list<Entry> entries) {
        for (const auto& entry : entries) {
            set(entry.first, entry.second);
        }
    }

    void set(const std::string& name, const std::string& value) {
        auto it = std::find_if(m_entries.begin(), m_entries.end(),
                               [&name](const Entry& entry) { return entry.first == name; });
        if (it != m_entries.end()) {
            it->second = value;
        } else {
            m_entries.emplace_back(name, value);
        }
    }

    /** @brief Exact-name lookup; nullptr when absent. */
    const std::string* find(const std::string& name) const {
        auto it = std::find_if(m_entries.begin(), m_entries.end(),
                               [&name](const Entry& entry) { return entry.first == name; });
        return it != m_entries.end() ? &it->second : nullptr;
    }

    const std::string& at(const std::string& name) const {
        if (const std::string* value = find(name)) return *value;
        throw std::out_of_range("Biomarker not present: " + name);
    }

    size_t count(const std::string& name) const { return find(name) ? 1 : 0; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

    bool operator==(const BiomarkerPanel& other) const { return m_entries == other.m_entries; }
    bool operator!=(const BiomarkerPanel& other) const { return !(*this == other); }

private:
    std::vector<Entry> m_entries;
};

} // namespace trialguard::domain::clinical

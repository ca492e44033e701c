#include "metadata_store.hpp"
#include "atomic_file.hpp"
#include "errors.hpp"
#include <fstream>
#include <stdexcept>

namespace quarry {

using json = nlohmann::json;

void MetadataStore::put(const QuestionRecord& record) {
    if (record.text.empty()) {
        throw IndexWriteError("Refusing to store record " + std::to_string(record.id) +
                              " with empty text");
    }
    if (record.sources.empty()) {
        throw IndexWriteError("Refusing to store record " + std::to_string(record.id) +
                              " without a source");
    }
    if (contains(record.id)) {
        throw IndexWriteError("Duplicate metadata id " + std::to_string(record.id));
    }
    records_.emplace(record.id, record);
}

const QuestionRecord* MetadataStore::find(uint64_t id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

std::vector<uint64_t> MetadataStore::ids() const {
    std::vector<uint64_t> out;
    out.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        out.push_back(id);
    }
    return out;
}

std::vector<QuestionRecord> MetadataStore::records() const {
    std::vector<QuestionRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        out.push_back(record);
    }
    return out;
}

void MetadataStore::save(const std::string& path, uint64_t next_id) const {
    json records = json::object();
    for (const auto& [id, record] : records_) {
        records[std::to_string(id)] = record_to_json(record);
    }

    json j = {
        {"next_id", next_id},
        {"records", records}
    };

    write_file_atomically(path, [&](std::ostream& out) {
        out << j.dump(2, ' ', false, json::error_handler_t::replace);
    });
}

MetadataStore MetadataStore::load(const std::string& path, uint64_t& next_id) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open metadata file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Metadata file " + path + " is not valid JSON: " + e.what());
    }

    if (!j.is_object() || !j.contains("records") || !j["records"].is_object()) {
        throw std::runtime_error("Metadata file " + path + " has no 'records' object");
    }
    next_id = j.value("next_id", uint64_t(0));

    MetadataStore store;
    for (const auto& [key, record_json] : j["records"].items()) {
        QuestionRecord record;
        try {
            record = record_from_json(record_json);
        } catch (const std::exception& e) {
            throw std::runtime_error("Record " + key + " in " + path + ": " + e.what());
        }
        if (std::to_string(record.id) != key) {
            throw std::runtime_error("Record key " + key + " does not match its id " +
                                     std::to_string(record.id));
        }
        try {
            store.put(record);
        } catch (const IndexWriteError& e) {
            throw std::runtime_error(std::string(e.what()) + " in " + path);
        }
    }
    return store;
}

} // namespace quarry

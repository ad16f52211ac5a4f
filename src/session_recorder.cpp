#include "session_recorder.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace carebridge {

namespace {

const char* kEventsFile = "events.jsonl";
const char* kRecordFile = "session.json";

/// Session ids become directory names; refuse anything that could escape the store
bool safe_session_id(const std::string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    });
}

} // namespace

class SessionRecorder::Impl {
public:
    explicit Impl(const std::string& store_dir) : store_dir_(store_dir) {
        std::error_code ec;
        fs::create_directories(store_dir_, ec);
        if (ec) {
            LOG_ERROR("Cannot create session store " + store_dir_ + ": " + ec.message());
        }
    }

    VoidResult append_event(const Event& event) {
        if (!safe_session_id(event.session_id)) {
            return make_error(ErrorType::InvalidInput, "unsafe session id: " + event.session_id);
        }
        std::string line = event.to_json().dump() + "\n";

        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = ensure_session_dir(event.session_id);
        if (dir.is_error()) return dir.error();

        std::ofstream file(dir.value() / kEventsFile, std::ios::app | std::ios::binary);
        if (!file.is_open()) {
            return make_io_error("cannot open event log for " + event.session_id);
        }
        file << line;
        file.flush();
        if (!file) {
            return make_io_error("write failed for event " + std::to_string(event.sequence) +
                                 " of " + event.session_id);
        }
        return {};
    }

    VoidResult write_record(const std::string& session_id, const json& record) {
        if (!safe_session_id(session_id)) {
            return make_error(ErrorType::InvalidInput, "unsafe session id: " + session_id);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = ensure_session_dir(session_id);
        if (dir.is_error()) return dir.error();

        fs::path target = dir.value() / kRecordFile;
        fs::path tmp = target;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::trunc);
            if (!file.is_open()) {
                return make_io_error("cannot write " + tmp.string());
            }
            file << record.dump(2) << "\n";
            if (!file) {
                return make_io_error("write failed for " + tmp.string());
            }
        }
        std::error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            return make_io_error("cannot replace " + target.string() + ": " + ec.message());
        }
        return {};
    }

    Result<json> load_record(const std::string& session_id) const {
        if (!safe_session_id(session_id)) {
            return make_error(ErrorType::InvalidInput, "unsafe session id: " + session_id);
        }
        fs::path path = fs::path(store_dir_) / session_id / kRecordFile;
        std::lock_guard<std::mutex> lock(mutex_);
        std::ifstream file(path);
        if (!file.is_open()) {
            return make_not_found_error(session_id);
        }
        try {
            json record;
            file >> record;
            return record;
        } catch (const json::exception& e) {
            return make_parse_error("malformed session record for " + session_id + ": " + e.what());
        }
    }

    Result<std::vector<Event>> load_events(const std::string& session_id) const {
        if (!safe_session_id(session_id)) {
            return make_error(ErrorType::InvalidInput, "unsafe session id: " + session_id);
        }
        fs::path path = fs::path(store_dir_) / session_id / kEventsFile;

        std::vector<std::string> lines;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::ifstream file(path);
            if (!file.is_open()) {
                return make_not_found_error(session_id);
            }
            std::string line;
            while (std::getline(file, line)) {
                if (!line.empty()) lines.push_back(line);
            }
        }

        std::vector<Event> events;
        events.reserve(lines.size());
        for (size_t i = 0; i < lines.size(); ++i) {
            json j = json::parse(lines[i], nullptr, false);
            Result<Event> event = j.is_discarded() ? Result<Event>(make_parse_error("not JSON"))
                                                   : Event::from_json(j);
            if (event.is_error()) {
                if (i + 1 == lines.size()) {
                    LOG_WARN("Dropping torn last line of " + path.string());
                    break;
                }
                return make_parse_error("line " + std::to_string(i + 1) + " of " + path.string() + ": " +
                                        event.error().message);
            }
            events.push_back(event.value());
        }
        return events;
    }

    std::vector<std::string> list_sessions() const {
        std::vector<std::string> ids;
        std::error_code ec;
        if (!fs::is_directory(store_dir_, ec)) return ids;
        for (const auto& entry : fs::directory_iterator(store_dir_, ec)) {
            if (entry.is_directory() && fs::exists(entry.path() / kEventsFile)) {
                ids.push_back(entry.path().filename().string());
            }
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    bool has_session(const std::string& session_id) const {
        if (!safe_session_id(session_id)) return false;
        std::error_code ec;
        return fs::exists(fs::path(store_dir_) / session_id / kEventsFile, ec);
    }

    const std::string& store_dir() const { return store_dir_; }

private:
    Result<fs::path> ensure_session_dir(const std::string& session_id) {
        fs::path dir = fs::path(store_dir_) / session_id;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return make_io_error("cannot create " + dir.string() + ": " + ec.message());
        }
        return dir;
    }

    std::string store_dir_;
    mutable std::mutex mutex_;
};

SessionRecorder::SessionRecorder(const std::string& store_dir)
    : pimpl_(std::make_unique<Impl>(store_dir)) {}

SessionRecorder::~SessionRecorder() = default;

VoidResult SessionRecorder::append_event(const Event& event) {
    return pimpl_->append_event(event);
}

VoidResult SessionRecorder::write_record(const std::string& session_id, const json& record) {
    return pimpl_->write_record(session_id, record);
}

Result<json> SessionRecorder::load_record(const std::string& session_id) const {
    return pimpl_->load_record(session_id);
}

Result<std::vector<Event>> SessionRecorder::load_events(const std::string& session_id) const {
    return pimpl_->load_events(session_id);
}

std::vector<std::string> SessionRecorder::list_sessions() const {
    return pimpl_->list_sessions();
}

bool SessionRecorder::has_session(const std::string& session_id) const {
    return pimpl_->has_session(session_id);
}

const std::string& SessionRecorder::store_dir() const {
    return pimpl_->store_dir();
}

} // namespace carebridge

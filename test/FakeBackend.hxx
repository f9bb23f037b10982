/*
 * In-memory library for the browse tests
 */

#ifndef _FAKEBACKEND_H_INCLUDED_
#define _FAKEBACKEND_H_INCLUDED_

#include <string>
#include <unordered_map>
#include <vector>

#include "backend/libbackend.hxx"

// Answers queries from a table keyed by the first command word. Records
// the commands it was given.
class FakeBackend : public LibraryBackend {
public:
    FakeBackend()
        : base("http://lib:9000"), fail(false), scantime("1000") {}

    virtual bool execute(const std::vector<std::string>& words,
                         QueryResult& result, std::string& reason) {
        commands.push_back(join(words));
        if (fail) {
            reason = "connection refused";
            return false;
        }
        auto it = answers.find(words.empty() ? std::string() : words[0]);
        result = it == answers.end() ? QueryResult() : it->second;
        return true;
    }

    virtual bool trackDetails(const std::vector<std::string>& ids,
                              const std::string& tags,
                              std::unordered_map<std::string, BackendRow>& out,
                              std::string& reason) {
        commands.push_back("trackDetails " + join(ids) + " " + tags);
        out.clear();
        for (const auto& id : ids) {
            auto it = tracks.find(id);
            if (it != tracks.end()) {
                out[id] = it->second;
            }
        }
        return true;
    }

    virtual bool lastScanTime(std::string& value, std::string& reason) {
        value = scantime;
        return true;
    }

    virtual const std::string& baseURL() const {
        return base;
    }

    static std::string join(const std::vector<std::string>& words) {
        std::string out;
        for (const auto& word : words) {
            if (!out.empty()) {
                out += " ";
            }
            out += word;
        }
        return out;
    }

    std::string base;
    bool fail;
    std::string scantime;
    std::unordered_map<std::string, QueryResult> answers;
    std::unordered_map<std::string, BackendRow> tracks;
    std::vector<std::string> commands;
};

#endif /* _FAKEBACKEND_H_INCLUDED_ */

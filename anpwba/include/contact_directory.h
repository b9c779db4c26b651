#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace anpwba {

struct Contact {
    std::string did;                // required non-empty; syntax not validated
    std::optional<std::string> name;
    std::optional<std::string> host;
    std::optional<int> port;
    std::string created_at;         // ISO8601 UTC
    std::string updated_at;         // ISO8601 UTC
};

// Fields left empty are not touched by update_contact().
struct ContactUpdate {
    std::optional<std::string> name;
    std::optional<std::string> host;
    std::optional<int> port;
};

// Peer address book for one local identity. Thread-safe; optional
// write-through JSON persistence like TokenLedger.
class ContactDirectory {
public:
    explicit ContactDirectory(std::string json_path = "");

    bool load(std::string* err = nullptr);
    void set_clock(std::function<long()> now);

    // Upsert by did. Re-adding keeps created_at and refreshes updated_at.
    // nullopt (nothing stored) when did is empty.
    std::optional<Contact> add_contact(const Contact& c);
    std::optional<Contact> get_contact(const std::string& did) const;
    std::vector<Contact> list_contacts() const;

    // nullopt if did is unknown.
    std::optional<Contact> update_contact(const std::string& did, const ContactUpdate& u);

    bool remove_contact(const std::string& did);

private:
    mutable std::mutex mu_;
    std::string json_path_;
    std::function<long()> now_;
    std::map<std::string, Contact> contacts_;

    std::string now_iso() const;
    void persist_locked(const char* op);
    bool save_atomic(std::string* err);
};

} // namespace anpwba

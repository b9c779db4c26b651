#include "contact_directory.h"

#include "anpwba_util.h"

#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace anpwba {

ContactDirectory::ContactDirectory(std::string json_path)
    : json_path_(std::move(json_path)) {}

void ContactDirectory::set_clock(std::function<long()> now) {
    std::lock_guard<std::mutex> lk(mu_);
    now_ = std::move(now);
}

std::string ContactDirectory::now_iso() const {
    return iso_utc_from_epoch(now_ ? now_() : now_epoch());
}

bool ContactDirectory::load(std::string* err) {
    std::lock_guard<std::mutex> lk(mu_);
    contacts_.clear();
    if (json_path_.empty()) return true;

    std::ifstream f(json_path_);
    if (!f.good()) return true;

    json root;
    try {
        f >> root;
    } catch (const std::exception& e) {
        if (err) *err = std::string("contacts parse failed: ") + e.what();
        return false;
    }
    if (!root.is_object() || !root.contains("contacts") || !root["contacts"].is_array()) return true;

    for (const auto& it : root["contacts"]) {
        if (!it.is_object() || !it.contains("did") || !it["did"].is_string()) continue;
        Contact c;
        c.did = it["did"].get<std::string>();
        if (it.contains("name") && it["name"].is_string()) c.name = it["name"].get<std::string>();
        if (it.contains("host") && it["host"].is_string()) c.host = it["host"].get<std::string>();
        if (it.contains("port") && it["port"].is_number_integer()) c.port = it["port"].get<int>();
        if (it.contains("created_at") && it["created_at"].is_string()) c.created_at = it["created_at"].get<std::string>();
        c.updated_at = c.created_at;
        if (it.contains("updated_at") && it["updated_at"].is_string()) c.updated_at = it["updated_at"].get<std::string>();
        if (c.did.empty()) continue;
        contacts_[c.did] = std::move(c);
    }
    return true;
}

bool ContactDirectory::save_atomic(std::string* err) {
    json root;
    root["contacts"] = json::array();
    for (const auto& kv : contacts_) {
        const Contact& c = kv.second;
        json it;
        it["did"] = c.did;
        if (c.name) it["name"] = *c.name;
        if (c.host) it["host"] = *c.host;
        if (c.port) it["port"] = *c.port;
        it["created_at"] = c.created_at;
        it["updated_at"] = c.updated_at;
        root["contacts"].push_back(std::move(it));
    }

    std::filesystem::path p(json_path_);
    std::error_code ec;
    if (!p.parent_path().empty()) std::filesystem::create_directories(p.parent_path(), ec);

    std::filesystem::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            if (err) *err = "failed to open tmp for write: " + tmp.string();
            return false;
        }
        out << root.dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            if (err) *err = "failed writing tmp: " + tmp.string();
            return false;
        }
    }

    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        if (err) *err = std::string("rename(tmp->contacts) failed: ") + ec.message();
        return false;
    }
    return true;
}

void ContactDirectory::persist_locked(const char* op) {
    if (json_path_.empty()) return;
    std::string err;
    if (!save_atomic(&err)) {
        std::cerr << "[contacts] WARNING: " << op << " not persisted: " << err << std::endl;
    }
}

std::optional<Contact> ContactDirectory::add_contact(const Contact& c_in) {
    if (c_in.did.empty()) {
        std::cerr << "[contacts] WARNING: ignoring contact without did" << std::endl;
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lk(mu_);
    const std::string ts = now_iso();

    Contact c = c_in;
    auto it = contacts_.find(c.did);
    c.created_at = (it != contacts_.end()) ? it->second.created_at : ts;
    c.updated_at = ts;

    contacts_[c.did] = c;
    persist_locked("add_contact");
    return c;
}

std::optional<Contact> ContactDirectory::get_contact(const std::string& did) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = contacts_.find(did);
    if (it == contacts_.end()) return std::nullopt;
    return it->second;
}

std::vector<Contact> ContactDirectory::list_contacts() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Contact> out;
    out.reserve(contacts_.size());
    for (const auto& kv : contacts_) out.push_back(kv.second);
    return out;
}

std::optional<Contact> ContactDirectory::update_contact(const std::string& did, const ContactUpdate& u) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = contacts_.find(did);
    if (it == contacts_.end()) return std::nullopt;

    if (u.name) it->second.name = u.name;
    if (u.host) it->second.host = u.host;
    if (u.port) it->second.port = u.port;
    it->second.updated_at = now_iso();

    persist_locked("update_contact");
    return it->second;
}

bool ContactDirectory::remove_contact(const std::string& did) {
    std::lock_guard<std::mutex> lk(mu_);
    if (contacts_.erase(did) == 0) return false;
    persist_locked("remove_contact");
    return true;
}

} // namespace anpwba

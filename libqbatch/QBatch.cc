#include <qbatch/QBatch.hh>

#include <qbatch/Util.hh>

#include <qpdf/QIntC.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>

using namespace qbatch;

class QBatch::Members
{
  public:
    Members() = default;
    Members(Members const&) = delete;
    ~Members() = default;

    std::vector<QBatchEntry> entries;
    int next_id{1};
    bool locked{false};
    std::function<void(QBatchEvent const&)> change_handler;
};

QBatch::QBatch() :
    m(std::make_unique<Members>())
{
}

QBatch::~QBatch() = default;

QBatch::AddResult
QBatch::addFiles(std::vector<std::string> const& paths)
{
    checkUnlocked();
    AddResult result;
    for (auto const& path: paths) {
        qbatch_entry_kind_e kind;
        if (!QBatchEntry::kindForFilename(path, &kind)) {
            result.rejected.emplace_back(
                qbatch_e_unsupported_format,
                path,
                "",
                "unsupported file type; expected PDF, TIFF, or JPG");
            continue;
        }
        if (!(util::is_regular_file(path) && QUtil::file_can_be_opened(path.c_str()))) {
            result.rejected.emplace_back(
                qbatch_e_source_missing, path, "", "file does not exist or can't be read");
            continue;
        }
        std::string source = util::absolute_path(path);
        bool listed = std::any_of(m->entries.begin(), m->entries.end(), [&source](auto const& e) {
            return e.getSourcePath() == source;
        });
        if (listed) {
            result.skipped.push_back(path);
            continue;
        }
        std::string name = uniqueName(QUtil::path_basename(source));
        size_t position = m->entries.size();
        int id = m->next_id++;
        m->entries.push_back(QBatchEntry(id, source, name, kind, position));
        result.added.push_back(id);
        notify({QBatchEvent::ev_added, id, position, position, name, name});
    }
    return result;
}

void
QBatch::remove(int id)
{
    checkUnlocked();
    size_t idx = indexOf(id);
    std::string name = m->entries.at(idx).getDisplayName();
    m->entries.erase(m->entries.begin() + QIntC::to_longlong(idx));
    renumber();
    notify({QBatchEvent::ev_removed, id, idx, idx, name, name});
}

void
QBatch::reorder(int id, int new_position)
{
    checkUnlocked();
    size_t idx = indexOf(id);
    if (new_position < 0 || QIntC::to_size(new_position) >= m->entries.size()) {
        throw QBatchExc(
            qbatch_e_out_of_range,
            "",
            m->entries.at(idx).getDisplayName(),
            "position " + std::to_string(new_position) + " is outside of 0.." +
                std::to_string(m->entries.size() - 1));
    }
    size_t target = QIntC::to_size(new_position);
    if (target == idx) {
        return;
    }
    auto first = m->entries.begin();
    if (target < idx) {
        std::rotate(
            first + QIntC::to_longlong(target),
            first + QIntC::to_longlong(idx),
            first + QIntC::to_longlong(idx + 1));
    } else {
        std::rotate(
            first + QIntC::to_longlong(idx),
            first + QIntC::to_longlong(idx + 1),
            first + QIntC::to_longlong(target + 1));
    }
    renumber();
    auto const& name = m->entries.at(target).getDisplayName();
    notify({QBatchEvent::ev_moved, id, idx, target, name, name});
}

void
QBatch::rename(int id, std::string const& new_name)
{
    checkUnlocked();
    size_t idx = indexOf(id);
    QBatchEntry& entry = m->entries.at(idx);
    std::string name = util::trim(new_name);
    if (name.empty()) {
        throw QBatchExc(qbatch_e_invalid_name, "", entry.getDisplayName(), "new name is empty");
    }
    if (std::any_of(name.begin(), name.end(), util::is_path_separator)) {
        throw QBatchExc(
            qbatch_e_invalid_name,
            "",
            entry.getDisplayName(),
            "new name " + name + " may not contain a path separator");
    }
    std::string ext = util::path_extension(name);
    if (ext.empty()) {
        std::string current = util::path_extension(entry.getDisplayName());
        if (current.empty()) {
            current = util::path_extension(entry.getSourcePath());
        }
        name += current;
    } else {
        qbatch_entry_kind_e kind;
        if (!(QBatchEntry::kindForFilename(name, &kind) && kind == entry.getKind())) {
            throw QBatchExc(
                qbatch_e_unsupported_format,
                "",
                entry.getDisplayName(),
                "new name " + name + " must keep the file as " +
                    QBatchEntry::kindName(entry.getKind()));
        }
    }
    if (name == entry.getDisplayName()) {
        return;
    }
    if (nameInUse(name, id)) {
        throw QBatchExc(
            qbatch_e_duplicate_name,
            "",
            entry.getDisplayName(),
            "another entry is already named " + name);
    }
    std::string old_name = entry.display_name;
    entry.display_name = name;
    notify({QBatchEvent::ev_renamed, id, idx, idx, old_name, name});
}

void
QBatch::moveEntries(std::vector<int> const& ids, int offset)
{
    checkUnlocked();
    std::vector<size_t> rows;
    for (int id: ids) {
        rows.push_back(indexOf(id));
    }
    if (offset == 0 || rows.empty()) {
        return;
    }
    std::sort(rows.begin(), rows.end());
    rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
    if (offset > 0) {
        std::reverse(rows.begin(), rows.end());
    }
    long long n = QIntC::to_longlong(m->entries.size());
    for (size_t row: rows) {
        long long target = QIntC::to_longlong(row) + offset;
        if (target < 0 || target >= n) {
            continue;
        }
        // reorder notifies
        reorder(m->entries.at(row).getId(), QIntC::to_int(target));
    }
}

size_t
QBatch::size() const
{
    return m->entries.size();
}

bool
QBatch::empty() const
{
    return m->entries.empty();
}

std::vector<QBatchEntry> const&
QBatch::getEntries() const
{
    return m->entries;
}

QBatchEntry const&
QBatch::getEntry(int id) const
{
    return m->entries.at(indexOf(id));
}

bool
QBatch::contains(int id) const
{
    return std::any_of(
        m->entries.begin(), m->entries.end(), [id](auto const& e) { return e.getId() == id; });
}

QBatchEntry const*
QBatch::findByName(std::string const& name) const
{
    for (auto const& entry: m->entries) {
        if (QUtil::str_compare_nocase(entry.getDisplayName().c_str(), name.c_str()) == 0) {
            return &entry;
        }
    }
    return nullptr;
}

void
QBatch::setChangeHandler(std::function<void(QBatchEvent const&)> handler)
{
    m->change_handler = handler;
}

bool
QBatch::isLocked() const
{
    return m->locked;
}

void
QBatch::lock()
{
    m->locked = true;
}

void
QBatch::unlock()
{
    m->locked = false;
}

size_t
QBatch::indexOf(int id) const
{
    for (size_t i = 0; i < m->entries.size(); ++i) {
        if (m->entries.at(i).getId() == id) {
            return i;
        }
    }
    throw QBatchExc(qbatch_e_not_found, "", "", "no entry with id " + std::to_string(id));
}

void
QBatch::checkUnlocked() const
{
    if (m->locked) {
        throw QBatchExc(
            qbatch_e_batch_locked,
            "",
            "",
            "the batch can't be changed while a merge or export is in progress");
    }
}

std::string
QBatch::uniqueName(std::string const& name) const
{
    if (!nameInUse(name, 0)) {
        return name;
    }
    std::string ext;
    std::string stem = name;
    auto dot = name.rfind('.');
    if (dot != std::string::npos && dot != 0) {
        ext = name.substr(dot);
        stem = name.substr(0, dot);
    }
    for (unsigned long long counter = 1;; ++counter) {
        std::string candidate = stem + "_" + QUtil::uint_to_string(counter) + ext;
        if (!nameInUse(candidate, 0)) {
            return candidate;
        }
    }
}

bool
QBatch::nameInUse(std::string const& name, int except_id) const
{
    for (auto const& entry: m->entries) {
        if (entry.getId() != except_id &&
            QUtil::str_compare_nocase(entry.getDisplayName().c_str(), name.c_str()) == 0) {
            return true;
        }
    }
    return false;
}

void
QBatch::renumber()
{
    size_t position = 0;
    for (auto& entry: m->entries) {
        entry.position = position++;
    }
}

void
QBatch::notify(QBatchEvent const& event)
{
    if (m->change_handler) {
        m->change_handler(event);
    }
}

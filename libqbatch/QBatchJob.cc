#include <qbatch/QBatchJob.hh>

#include <qbatch/QBatchSession.hh>
#include <qbatch/QBatchUsage.hh>
#include <qbatch/Util.hh>

#include <qpdf/QIntC.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>
#include <cstdio>
#include <list>

using namespace qbatch;

struct QBatchJob::Action
{
    enum type_e {
        a_add,
        a_remove,
        a_move,
        a_up,
        a_down,
        a_rename,
        a_list,
        a_merge,
        a_export,
        // Only used while reading argv; replaced by the file's commands
        a_commands,
    };

    type_e type;
    std::vector<std::string> args;
};

class QBatchJob::Members
{
  public:
    Members() :
        log(QPDFLogger::defaultLogger())
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

    std::shared_ptr<QPDFLogger> log;
    std::string message_prefix{"qbatch"};
    std::vector<Action> actions;
    QBatchExporter::Options export_options;
    bool verbose{false};
    bool show_progress{false};
    bool show_help{false};
    bool show_version{false};
    bool has_errors{false};
    bool has_warnings{false};
};

QBatchJob::QBatchJob() :
    m(std::make_unique<Members>())
{
}

QBatchJob::~QBatchJob() = default;

char const*
QBatchJob::usage()
{
    return "Usage: qbatch [options] [file ...]\n"
           "\n"
           "Add PDF, TIFF, and JPG files to a batch, edit the batch, and merge it into\n"
           "one PDF file or export it as JPG files. Positions are numbered from 1.\n"
           "\n"
           "  --merge=file        merge all entries into one PDF file\n"
           "  --export=dir        export all entries as JPG files into dir\n"
           "  --dpi=n             resolution for PDF pages on export (default 200)\n"
           "  --quality=n         JPEG quality on export, 1 to 100 (default 90)\n"
           "  --overwrite         overwrite existing files on export\n"
           "  --remove=n          remove the entry at position n\n"
           "  --move=n,m          move the entry at position n to position m\n"
           "  --rename=n,name     rename the entry at position n\n"
           "  --list              print the batch\n"
           "  --commands=file     read commands from file (\"-\" for standard input)\n"
           "  --progress          print progress of merge and export\n"
           "  --verbose           print extra information\n"
           "  --version           print the version\n"
           "  --help              print this help\n"
           "\n"
           "Edits are applied in order after all files are added. --merge and --export\n"
           "run after all edits. A command file has one command per line:\n"
           "\n"
           "  add PATH...   remove N   move N M   up N...   down N...\n"
           "  rename N NAME   list   merge FILE   export DIR\n"
           "\n"
           "Lines starting with # are ignored.\n";
}

static std::string
option_value(std::string const& option, std::string const& value)
{
    if (value.empty()) {
        throw QBatchUsage(option + " requires a value");
    }
    return value;
}

// Return the number in str, which must contain only digits.
static int
to_number(std::string const& str, std::string const& what)
{
    if (str.empty() || str.length() > 9 ||
        !std::all_of(str.begin(), str.end(), [](char ch) { return ch >= '0' && ch <= '9'; })) {
        throw QBatchUsage(what + " must be a number; got \"" + str + "\"");
    }
    return QUtil::string_to_int(str.c_str());
}

static std::vector<std::string>
split_words(std::string const& str)
{
    std::vector<std::string> result;
    std::string word;
    for (char ch: str) {
        if (util::is_space(ch)) {
            if (!word.empty()) {
                result.push_back(word);
                word.clear();
            }
        } else {
            word.append(1, ch);
        }
    }
    if (!word.empty()) {
        result.push_back(word);
    }
    return result;
}

void
QBatchJob::initializeFromArgv(char const* const argv[])
{
    if (!(argv && argv[0])) {
        throw std::logic_error("QBatchJob::initializeFromArgv called with empty argv");
    }
    Action add{Action::a_add, {}};
    std::vector<Action> edits;
    std::vector<Action> finals;
    for (int i = 1; argv[i]; ++i) {
        std::string arg = argv[i];
        if (!((arg.length() > 2) && (arg.compare(0, 2, "--") == 0))) {
            add.args.push_back(arg);
            continue;
        }
        std::string option = arg;
        std::string value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            option = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }
        if (option == "--help") {
            m->show_help = true;
        } else if (option == "--version") {
            m->show_version = true;
        } else if (option == "--verbose") {
            m->verbose = true;
        } else if (option == "--progress") {
            m->show_progress = true;
        } else if (option == "--list") {
            edits.push_back({Action::a_list, {}});
        } else if (option == "--overwrite") {
            m->export_options.collision = qbatch_c_overwrite;
        } else if (option == "--dpi") {
            m->export_options.dpi = to_number(option_value(option, value), option);
        } else if (option == "--quality") {
            m->export_options.quality = to_number(option_value(option, value), option);
        } else if (option == "--merge") {
            finals.push_back({Action::a_merge, {option_value(option, value)}});
        } else if (option == "--export") {
            finals.push_back({Action::a_export, {option_value(option, value)}});
        } else if (option == "--remove") {
            to_number(option_value(option, value), option);
            edits.push_back({Action::a_remove, {value}});
        } else if (option == "--move" || option == "--rename") {
            value = option_value(option, value);
            auto comma = value.find(',');
            if (comma == std::string::npos) {
                throw QBatchUsage(
                    option + " requires a position and " +
                    (option == "--move" ? "a new position" : "a new name") +
                    " separated by a comma");
            }
            std::string position = value.substr(0, comma);
            to_number(position, option + " position");
            if (option == "--move") {
                to_number(value.substr(comma + 1), option + " new position");
            }
            edits.push_back(
                {option == "--move" ? Action::a_move : Action::a_rename,
                 {position, value.substr(comma + 1)}});
        } else if (option == "--commands") {
            edits.push_back({Action::a_commands, {option_value(option, value)}});
        } else {
            throw QBatchUsage("unrecognized argument " + arg);
        }
    }
    if (m->show_help || m->show_version) {
        return;
    }
    if (add.args.empty() && edits.empty() && finals.empty()) {
        throw QBatchUsage("no files or commands given");
    }
    if (!add.args.empty()) {
        m->actions.push_back(add);
    }
    for (auto const& action: edits) {
        if (action.type == Action::a_commands) {
            addCommandsFromFile(action.args.at(0));
        } else {
            m->actions.push_back(action);
        }
    }
    m->actions.insert(m->actions.end(), finals.begin(), finals.end());
}

void
QBatchJob::addCommandsFromFile(std::string const& filename)
{
    std::list<std::string> lines;
    if (filename == "-") {
        lines = QUtil::read_lines_from_file(stdin);
    } else {
        lines = QUtil::read_lines_from_file(filename.c_str());
    }
    size_t lineno = 0;
    for (auto const& line: lines) {
        ++lineno;
        try {
            addCommand(line);
        } catch (QBatchUsage& e) {
            throw QBatchUsage(
                (filename == "-" ? std::string("standard input") : filename) + ":" +
                std::to_string(lineno) + ": " + e.what());
        }
    }
}

void
QBatchJob::addCommand(std::string const& line)
{
    std::string text = util::trim(line);
    if (text.empty() || text.at(0) == '#') {
        return;
    }
    std::string command = text;
    std::string rest;
    auto space = std::find_if(text.begin(), text.end(), util::is_space);
    if (space != text.end()) {
        command = std::string(text.begin(), space);
        rest = util::trim(std::string(space, text.end()));
    }
    auto words = split_words(rest);
    auto need = [&command, &words](size_t min, size_t max, char const* args) {
        if (words.size() < min || words.size() > max) {
            throw QBatchUsage("usage: " + command + " " + args);
        }
    };
    // Validate positions now so that a bad command file is reported before anything runs.
    auto positions = [&words](size_t count) {
        for (size_t i = 0; i < count; ++i) {
            to_number(words.at(i), "position");
        }
    };

    if (command == "add") {
        need(1, words.size(), "PATH...");
        m->actions.push_back({Action::a_add, words});
    } else if (command == "remove") {
        need(1, 1, "N");
        positions(1);
        m->actions.push_back({Action::a_remove, words});
    } else if (command == "move") {
        need(2, 2, "N M");
        positions(2);
        m->actions.push_back({Action::a_move, words});
    } else if (command == "up" || command == "down") {
        need(1, words.size(), "N...");
        positions(words.size());
        m->actions.push_back({command == "up" ? Action::a_up : Action::a_down, words});
    } else if (command == "rename") {
        // The name is the rest of the line and may contain spaces.
        need(2, words.size(), "N NAME");
        positions(1);
        std::string name = util::trim(rest.substr(words.at(0).length()));
        m->actions.push_back({Action::a_rename, {words.at(0), name}});
    } else if (command == "list") {
        need(0, 0, "");
        m->actions.push_back({Action::a_list, {}});
    } else if (command == "merge") {
        need(1, words.size(), "FILE");
        m->actions.push_back({Action::a_merge, {rest}});
    } else if (command == "export") {
        need(1, words.size(), "DIR");
        m->actions.push_back({Action::a_export, {rest}});
    } else {
        throw QBatchUsage("unknown command " + command);
    }
}

int
QBatchJob::idAtPosition(QBatchSession& session, std::string const& position)
{
    int n = to_number(position, "position");
    auto const& entries = session.getBatch().getEntries();
    if (n < 1 || QIntC::to_size(n) > entries.size()) {
        throw QBatchExc(
            qbatch_e_out_of_range, "", "", "there is no entry at position " + position);
    }
    return entries.at(QIntC::to_size(n - 1)).getId();
}

void
QBatchJob::list(QBatchSession& session)
{
    auto const& entries = session.getBatch().getEntries();
    auto& out = *m->log->getInfo();
    if (entries.empty()) {
        out << m->message_prefix << ": the batch is empty\n";
        return;
    }
    int width = QIntC::to_int(util::digits(entries.size()));
    for (auto const& entry: entries) {
        out << QUtil::uint_to_string(entry.getPosition() + 1, width) << ". "
            << entry.getDisplayName() << " (" << QBatchEntry::kindName(entry.getKind()) << ", "
            << entry.getSourcePath() << ")\n";
    }
}

void
QBatchJob::runAction(QBatchSession& session, Action const& action)
{
    QBatch& batch = session.getBatch();
    switch (action.type) {
    case Action::a_add:
        {
            auto result = session.addFiles(action.args);
            if (!(result.rejected.empty() && result.skipped.empty())) {
                m->has_warnings = true;
            }
            if (m->verbose) {
                *m->log->getInfo() << m->message_prefix << ": added " << result.added.size()
                                   << " file" << (result.added.size() == 1 ? "" : "s") << "\n";
            }
        }
        break;

    case Action::a_remove:
        batch.remove(idAtPosition(session, action.args.at(0)));
        break;

    case Action::a_move:
        {
            int id = idAtPosition(session, action.args.at(0));
            batch.reorder(id, to_number(action.args.at(1), "position") - 1);
        }
        break;

    case Action::a_up:
    case Action::a_down:
        {
            std::vector<int> ids;
            for (auto const& position: action.args) {
                ids.push_back(idAtPosition(session, position));
            }
            batch.moveEntries(ids, action.type == Action::a_up ? -1 : 1);
        }
        break;

    case Action::a_rename:
        batch.rename(idAtPosition(session, action.args.at(0)), action.args.at(1));
        break;

    case Action::a_list:
        list(session);
        break;

    case Action::a_merge:
    case Action::a_export:
        {
            bool merge = (action.type == Action::a_merge);
            std::string label = (merge ? "merge" : "export");
            session.setProgressHandler([this, label](size_t current, size_t total) {
                if (m->show_progress) {
                    *m->log->getInfo() << m->message_prefix << ": " << label << " progress: "
                                       << current << "/" << total << "\n";
                }
            });
            if (merge) {
                session.startMerge(action.args.at(0));
            } else {
                session.startExport(action.args.at(0), m->export_options);
            }
            QBatchResult result = session.wait();
            if (result.status == qbatch_s_failed) {
                m->has_errors = true;
            } else if (!result.failures.empty()) {
                m->has_warnings = true;
            }
            if (m->verbose && !merge) {
                *m->log->getInfo() << m->message_prefix << ": wrote " << result.outputs.size()
                                   << " files to " << action.args.at(0) << "\n";
            }
        }
        break;

    case Action::a_commands:
        throw std::logic_error("QBatchJob: command file action was not expanded");
    }
}

void
QBatchJob::run()
{
    if (m->show_help) {
        m->log->info(usage());
        return;
    }
    if (m->show_version) {
        *m->log->getInfo() << "qbatch version " << QBATCH_VERSION << "\n"
                           << "using qpdf version " << QPDF::QPDFVersion() << "\n";
        return;
    }
    QBatchSession session;
    session.setLogger(m->log);
    session.setVerbose(m->verbose);
    session.setMessagePrefix(m->message_prefix);
    for (auto const& action: m->actions) {
        try {
            runAction(session, action);
        } catch (QBatchExc& e) {
            *m->log->getError() << m->message_prefix << ": " << e.what() << "\n";
            m->has_errors = true;
        }
    }
}

int
QBatchJob::getExitCode() const
{
    if (m->has_errors) {
        return EXIT_ERROR;
    }
    if (m->has_warnings) {
        return EXIT_WARNING;
    }
    return qbatch_exit_success;
}

void
QBatchJob::setLogger(std::shared_ptr<QPDFLogger> l)
{
    m->log = l;
}

std::shared_ptr<QPDFLogger>
QBatchJob::getLogger() const
{
    return m->log;
}

void
QBatchJob::setMessagePrefix(std::string const& prefix)
{
    m->message_prefix = prefix;
}

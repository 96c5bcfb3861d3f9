#include "git_utils.hpp"
#include <cstdlib>
#include <fstream>
#include <system_error>

using namespace std;

namespace git {

using object_ptr = GitHandle<git_object, git_object_free>;

static unsigned int g_libgit_timeout = 0;
static constexpr int MAX_CREDENTIAL_ATTEMPTS = 3;

/**
 * @brief Read credentials from a file.
 *
 * The file is expected to contain the username on the first line and the
 * password on the second line.
 *
 * @return True if both username and password were read.
 */
static bool read_credential_file(const fs::path& path, std::string& user, std::string& pass) {
    std::ifstream ifs(path);
    if (!ifs)
        return false;
    std::getline(ifs, user);
    std::getline(ifs, pass);
    return !user.empty() && !pass.empty();
}

static std::optional<std::string> safe_getenv(const char* name) {
    const char* v = std::getenv(name);
    if (v)
        return std::string(v);
    return std::nullopt;
}

static void apply_timeout() {
#if LIBGIT2_VER_MAJOR > 1 || (LIBGIT2_VER_MAJOR == 1 && LIBGIT2_VER_MINOR >= 7)
    if (g_libgit_timeout > 0) {
        const int ms = static_cast<int>(g_libgit_timeout * 1000);
        git_libgit2_opts(GIT_OPT_SET_SERVER_CONNECT_TIMEOUT, ms);
        git_libgit2_opts(GIT_OPT_SET_SERVER_TIMEOUT, ms);
    }
#endif
}

void set_libgit_timeout(unsigned int seconds) {
    g_libgit_timeout = seconds;
    apply_timeout();
}

GitInitGuard::GitInitGuard() {
    git_libgit2_init();
    apply_timeout();
}

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

struct CredentialPayload {
    const TransportOptions* transport;
    int attempts;
};

/**
 * @brief libgit2 credential callback implementing precedence rules.
 *
 * Credentials are chosen in the following order:
 *  1. Explicit SSH key provided via options.
 *  2. SSH agent.
 *  3. `~/.ssh/id_rsa` when it exists.
 *  4. Username/password from file.
 *  5. Username/password from environment variables.
 *  6. Default credential helper.
 *
 * libgit2 keeps invoking the callback while the server rejects what it
 * returns, so attempts are capped.
 */
static int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                         unsigned int allowed_types, void* payload) {
    (void)url;
    auto* cp = static_cast<CredentialPayload*>(payload);
    if (cp && ++cp->attempts > MAX_CREDENTIAL_ATTEMPTS) {
        git_error_set_str(GIT_ERROR_NET, "authentication failed: credentials rejected");
        return GIT_EUSER;
    }
    const TransportOptions* opts = cp ? cp->transport : nullptr;
    auto env_user = safe_getenv("GIT_USERNAME");
    auto env_pass = safe_getenv("GIT_PASSWORD");
    std::string file_user;
    std::string file_pass;
    if (opts && !opts->credential_file.empty())
        read_credential_file(opts->credential_file, file_user, file_pass);
    std::string user_buf = username_from_url ? username_from_url
                                             : (!file_user.empty() ? file_user
                                                                   : (env_user ? *env_user : ""));
    const char* user = user_buf.empty() ? "git" : user_buf.c_str();

    if (allowed_types & GIT_CREDENTIAL_SSH_KEY) {
        if (opts && !opts->ssh_private_key.empty()) {
            std::string pub = opts->ssh_public_key.string();
            if (git_credential_ssh_key_new(out, user, pub.empty() ? nullptr : pub.c_str(),
                                           opts->ssh_private_key.string().c_str(), "") == 0)
                return 0;
        }
        // The agent is only worth one try; later attempts fall through to key files.
        if ((!cp || cp->attempts == 1) && git_credential_ssh_key_from_agent(out, user) == 0)
            return 0;
        if (auto home = safe_getenv("HOME")) {
            fs::path key = fs::path(*home) / ".ssh" / "id_rsa";
            std::error_code ec;
            if (fs::exists(key, ec) &&
                git_credential_ssh_key_new(out, user, nullptr, key.string().c_str(), "") == 0)
                return 0;
        }
    }
    if ((allowed_types & GIT_CREDENTIAL_USERNAME) && !user_buf.empty()) {
        if (git_credential_username_new(out, user) == 0)
            return 0;
    }
    if (allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) {
        if (!file_user.empty() && !file_pass.empty())
            return git_credential_userpass_plaintext_new(out, file_user.c_str(),
                                                         file_pass.c_str());
        if (env_user && env_pass)
            return git_credential_userpass_plaintext_new(out, env_user->c_str(),
                                                         env_pass->c_str());
    }
    return git_credential_default_new(out);
}

static void configure_fetch(git_fetch_options& fetch_opts, const TransportOptions* transport,
                            CredentialPayload& payload) {
    fetch_opts.callbacks.credentials = credential_cb;
    fetch_opts.callbacks.payload = &payload;
    if (transport && !transport->proxy_url.empty()) {
        fetch_opts.proxy_opts.type = GIT_PROXY_SPECIFIED;
        fetch_opts.proxy_opts.url = transport->proxy_url.c_str();
    } else {
        fetch_opts.proxy_opts.type = GIT_PROXY_AUTO;
    }
}

static void note_auth_failure(int err, const CredentialPayload& payload, bool* auth_failed) {
    if (!auth_failed)
        return;
    const git_error* e = git_error_last();
    if (err == GIT_EUSER || payload.attempts > MAX_CREDENTIAL_ATTEMPTS ||
        (e && e->message && std::string(e->message).find("auth") != std::string::npos))
        *auth_failed = true;
}

static git_repository* open_repo(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, repo.string().c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH,
                                nullptr) != 0) {
        set_error(error);
        return nullptr;
    }
    return raw;
}

bool is_git_repo(const fs::path& p) {
    git_repository* raw = open_repo(p, nullptr);
    if (!raw)
        return false;
    repo_ptr r(raw);
    return true;
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    git_repository* raw = open_repo(repo, error);
    if (!raw)
        return nullopt;
    repo_ptr r(raw);
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    git_repository* raw = open_repo(repo, error);
    if (!raw)
        return nullopt;
    repo_ptr r(raw);
    git_reference* head = nullptr;
    if (git_repository_head(&head, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr ref(head);
    const char* name = git_reference_shorthand(ref.get());
    string branch = name ? name : "";
    if (branch.empty()) {
        set_error(error);
        return nullopt;
    }
    return branch;
}

bool clone_bare(const fs::path& dest, const std::string& url, const TransportOptions* transport,
                bool* auth_failed, std::string* error) {
    git_clone_options opts = GIT_CLONE_OPTIONS_INIT;
    opts.bare = 1;
    CredentialPayload payload{transport, 0};
    configure_fetch(opts.fetch_opts, transport, payload);
    git_repository* raw = nullptr;
    int err = git_clone(&raw, url.c_str(), dest.string().c_str(), &opts);
    if (err != 0) {
        note_auth_failure(err, payload, auth_failed);
        set_error(error);
        return false;
    }
    repo_ptr r(raw);
    return true;
}

optional<string> fetch_remote(const fs::path& repo, const string& remote, const string& branch,
                              const TransportOptions* transport, bool* auth_failed,
                              string* error) {
    git_repository* raw_repo = open_repo(repo, error);
    if (!raw_repo)
        return nullopt;
    repo_ptr r(raw_repo);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);

    const string tracking = "refs/remotes/" + remote + "/" + branch;
    string refspec = "+refs/heads/" + branch + ":" + tracking;
    char* specs[] = {&refspec[0]};
    git_strarray refspecs{specs, 1};

    git_fetch_options fetch_opts = GIT_FETCH_OPTIONS_INIT;
    CredentialPayload payload{transport, 0};
    configure_fetch(fetch_opts, transport, payload);
    int err = git_remote_fetch(remote_handle.get(), &refspecs, &fetch_opts, nullptr);
    if (err != 0) {
        note_auth_failure(err, payload, auth_failed);
        set_error(error);
        return nullopt;
    }
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), tracking.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

static git_tree* lookup_tree(git_repository* repo, const string& revision) {
    git_object* raw_obj = nullptr;
    if (git_revparse_single(&raw_obj, repo, revision.c_str()) != 0)
        return nullptr;
    object_ptr obj(raw_obj);
    git_object* peeled = nullptr;
    if (git_object_peel(&peeled, obj.get(), GIT_OBJECT_TREE) != 0)
        return nullptr;
    return reinterpret_cast<git_tree*>(peeled);
}

struct ExportContext {
    git_repository* repo;
    fs::path dest;
    git_tree* base_tree;
    fs::path base_dir;
    string error;
};

// Reuse the previous export's copy of a blob that did not change.
static bool link_unchanged(const ExportContext& ctx, const string& rel,
                           const git_tree_entry* entry, const fs::path& target) {
    git_tree_entry* raw = nullptr;
    if (git_tree_entry_bypath(&raw, ctx.base_tree, rel.c_str()) != 0)
        return false;
    tree_entry_ptr old(raw);
    if (git_tree_entry_filemode(old.get()) != git_tree_entry_filemode(entry) ||
        !git_oid_equal(git_tree_entry_id(old.get()), git_tree_entry_id(entry)))
        return false;
    std::error_code ec;
    fs::create_hard_link(ctx.base_dir / rel, target, ec);
    return !ec;
}

static int export_entry(const char* root, const git_tree_entry* entry, void* payload) {
    auto* ctx = static_cast<ExportContext*>(payload);
    const string rel = string(root) + git_tree_entry_name(entry);
    const fs::path target = ctx->dest / rel;
    std::error_code ec;
    switch (git_tree_entry_type(entry)) {
    case GIT_OBJECT_TREE:
        fs::create_directories(target, ec);
        if (ec) {
            ctx->error = "cannot create " + target.string() + ": " + ec.message();
            return -1;
        }
        return 0;
    case GIT_OBJECT_BLOB:
        break;
    default:
        return 0; // submodule
    }
    const git_filemode_t mode = git_tree_entry_filemode(entry);
    if (mode == GIT_FILEMODE_LINK)
        return 0;
    if (ctx->base_tree && link_unchanged(*ctx, rel, entry, target))
        return 0;

    git_blob* raw = nullptr;
    if (git_blob_lookup(&raw, ctx->repo, git_tree_entry_id(entry)) != 0) {
        set_error(&ctx->error);
        return -1;
    }
    blob_ptr blob(raw);
    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    ofs.write(static_cast<const char*>(git_blob_rawcontent(blob.get())),
              static_cast<std::streamsize>(git_blob_rawsize(blob.get())));
    ofs.close();
    if (!ofs) {
        ctx->error = "cannot write " + target.string();
        return -1;
    }
    if (mode == GIT_FILEMODE_BLOB_EXECUTABLE)
        fs::permissions(target,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add, ec);
    return 0;
}

bool export_tree(const fs::path& repo, const std::string& revision, const fs::path& dest,
                 const fs::path& base_dir, const std::string& base_revision,
                 std::string* error) {
    git_repository* raw_repo = open_repo(repo, error);
    if (!raw_repo)
        return false;
    repo_ptr r(raw_repo);
    git_tree* raw_tree = lookup_tree(r.get(), revision);
    if (!raw_tree) {
        set_error(error);
        return false;
    }
    tree_ptr tree(raw_tree);

    tree_ptr base(nullptr);
    std::error_code ec;
    if (!base_dir.empty() && !base_revision.empty() && fs::is_directory(base_dir, ec))
        base.h = lookup_tree(r.get(), base_revision);

    fs::create_directories(dest, ec);
    if (ec) {
        if (error)
            *error = "cannot create " + dest.string() + ": " + ec.message();
        return false;
    }
    ExportContext ctx{r.get(), dest, base.get(), base_dir, {}};
    if (git_tree_walk(tree.get(), GIT_TREEWALK_PRE, export_entry, &ctx) != 0) {
        if (error) {
            if (!ctx.error.empty())
                *error = ctx.error;
            else
                set_error(error);
        }
        return false;
    }
    return true;
}

bool set_branch_target(const fs::path& repo, const std::string& branch,
                       const std::string& revision, std::string* error) {
    git_repository* raw_repo = open_repo(repo, error);
    if (!raw_repo)
        return false;
    repo_ptr r(raw_repo);
    git_oid oid;
    if (git_oid_fromstr(&oid, revision.c_str()) != 0) {
        set_error(error);
        return false;
    }
    const string refname = "refs/heads/" + branch;
    git_reference* raw_ref = nullptr;
    if (git_reference_create(&raw_ref, r.get(), refname.c_str(), &oid, 1,
                             "indexmirror: advance to fetched revision") != 0) {
        set_error(error);
        return false;
    }
    reference_ptr ref(raw_ref);
    if (git_repository_set_head(r.get(), refname.c_str()) != 0) {
        set_error(error);
        return false;
    }
    return true;
}

} // namespace git

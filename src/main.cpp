#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include <stdexcept>
#include "config.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "secrets_store.hpp"
#include "util.hpp"

enum class Action { None, Help, List, Encrypt, Decrypt, SetMaster, Key, Convert, Delete, Init };

struct CliArgs {
    Action action = Action::None;
    std::string file;
    std::string config;
    std::vector<std::string> operands;
    bool verbose = false;
};

static const char* kUsage =
    "usage: secman [-f FILE] [--config PATH] [-v] ACTION\n"
    "\n"
    "Manage the secrets of a project in a text file.\n"
    "\n"
    "actions:\n"
    "  -h, --help                 show this help\n"
    "  -l, --list                 list all secrets\n"
    "  -e, --encrypt              encrypt all secrets in the file\n"
    "  -d, --decrypt              decrypt all secrets in the file\n"
    "  -m, --master-key-env NAME  set NAME as the master key variable in the file\n"
    "  -k, --key                  print a valid encryption key (Fernet key)\n"
    "  -c, --convert OLD NEW      re-encrypt from the key in env var OLD to the key in NEW\n"
    "  -x, --delete NAME          delete one secret\n"
    "  -i, --init [NAME]          create a new secrets file\n"
    "\n"
    "options:\n"
    "  -f, --file FILE            target file (default: project_secrets.txt)\n"
    "      --config PATH          JSON configuration (default: secman.json if present)\n"
    "  -v, --verbose              print how each line was classified\n"
    "\n"
    "Notes:\n"
    "  Empty strings as secret values are not encrypted.\n"
    "  After encrypting secrets, the original variables are\n"
    "  left in the file, with empty strings as values.\n";

static bool is_opt(const char* a, const char* s, const char* l){
    return std::strcmp(a, s) == 0 || std::strcmp(a, l) == 0;
}

// Returns false on a usage error.
static bool parse_args(int argc, char** argv, CliArgs& out){
    auto set_action = [&](Action a){
        if (out.action != Action::None) return false;
        out.action = a; return true;
    };
    for (int i = 1; i < argc; ++i){
        const char* a = argv[i];
        auto need = [&](int n){
            if (i + n >= argc) return false;
            for (int k = 1; k <= n; ++k) out.operands.push_back(argv[i+k]);
            i += n; return true;
        };
        if (is_opt(a, "-h", "--help")) { if (!set_action(Action::Help)) return false; }
        else if (is_opt(a, "-l", "--list")) { if (!set_action(Action::List)) return false; }
        else if (is_opt(a, "-e", "--encrypt")) { if (!set_action(Action::Encrypt)) return false; }
        else if (is_opt(a, "-d", "--decrypt")) { if (!set_action(Action::Decrypt)) return false; }
        else if (is_opt(a, "-k", "--key")) { if (!set_action(Action::Key)) return false; }
        else if (is_opt(a, "-m", "--master-key-env")) { if (!set_action(Action::SetMaster) || !need(1)) return false; }
        else if (is_opt(a, "-c", "--convert")) { if (!set_action(Action::Convert) || !need(2)) return false; }
        else if (is_opt(a, "-x", "--delete")) { if (!set_action(Action::Delete) || !need(1)) return false; }
        else if (is_opt(a, "-i", "--init")) {
            if (!set_action(Action::Init)) return false;
            if (i + 1 < argc && argv[i+1][0] != '-') out.operands.push_back(argv[++i]);
        }
        else if (is_opt(a, "-v", "--verbose")) out.verbose = true;
        else if (is_opt(a, "-f", "--file")) { if (i + 1 >= argc) return false; out.file = argv[++i]; }
        else if (std::strcmp(a, "--config") == 0) { if (i + 1 >= argc) return false; out.config = argv[++i]; }
        else { fprintf(stderr, "secman: unrecognized argument '%s'\n", a); return false; }
    }
    return true;
}

static AppCfg load_app_cfg(const CliArgs& args){
    if (!args.config.empty()) return load_cfg(args.config);
    if (file_exists(kDefaultConfigPath)) return load_cfg(kDefaultConfigPath);
    return AppCfg{};
}

static void dump_lines(const SecretsStore& store){
    auto lines = store.load();
    for (size_t i = 0; i < lines.size(); ++i)
        fprintf(stderr, "[secman] line %zu: %s %s\n", i + 1, line_kind_name(lines[i].kind), declared_name(lines[i]).c_str());
}

static int run(const CliArgs& args){
    if (args.action == Action::None || args.action == Action::Help){
        printf("%s", kUsage);
        return 0;
    }
    if (args.action == Action::Key){
        printf("%s\n", FernetCipher::generate_key().c_str());
        return 0;
    }

    AppCfg cfg = load_app_cfg(args);
    FernetCipher cipher;
    SecretsStore store({args.file.empty() ? cfg.secrets_file : args.file, cfg.key_decl_name, cfg.key_env_name},
                       cipher, process_env());

    if (args.action == Action::Init){
        store.init(args.operands.empty() ? cfg.key_env_name : args.operands[0]);
        printf("Created %s\n", (args.file.empty() ? cfg.secrets_file : args.file).c_str());
        return 0;
    }
    if (args.verbose) dump_lines(store);

    switch (args.action){
        case Action::List:
            for (const auto& n: store.list()) printf("%s\n", n.c_str());
            return 0;
        case Action::Encrypt: {
            printf("Encrypting secrets ...\n");
            printf("NOTE: Empty string as secrets are not encrypted.\n");
            EncryptResult r = store.encrypt_all();
            for (const auto& n: r.skipped)
                printf("Skipping %s: already encrypted in the file.\n"
                       "        To re-encrypt it, delete the line and run the script again\n", n.c_str());
            for (const auto& n: r.encrypted)
                printf("Encrypted %s. Original unencrypted value has been removed from the file.\n", n.c_str());
            printf("Done. %zu secrets encrypted.\n", r.encrypted.size());
            return 0;
        }
        case Action::Decrypt: {
            DecryptResult r = store.decrypt_all();
            for (const auto& n: r.unsigned_names)
                fprintf(stderr, "Warning: %s has no signature metadata; decrypted without verification\n", n.c_str());
            printf("Done. %zu secrets decrypted.\n", r.decrypted.size());
            return 0;
        }
        case Action::SetMaster:
            if (!store.set_key_env(args.operands[0])){
                fprintf(stderr, "Error: no %s declaration in the file; add a line like %s = \"\" first\n",
                        cfg.key_decl_name.c_str(), cfg.key_decl_name.c_str());
                return 1;
            }
            printf("%s set to %s\n", cfg.key_decl_name.c_str(), args.operands[0].c_str());
            return 0;
        case Action::Convert: {
            ConvertResult r = store.convert(args.operands[0], args.operands[1]);
            for (const auto& n: r.unsigned_names)
                fprintf(stderr, "Warning: %s had no signature metadata; converted without verification\n", n.c_str());
            printf("Done. %zu secrets converted to %s.\n", r.converted.size(), args.operands[1].c_str());
            return 0;
        }
        case Action::Delete:
            if (!store.remove(args.operands[0])){
                fprintf(stderr, "Error: secret %s not found\n", args.operands[0].c_str());
                return 1;
            }
            printf("Deleted %s\n", args.operands[0].c_str());
            return 0;
        default:
            break;
    }
    return 0;
}

int main(int argc, char** argv){
    CliArgs args;
    if (!parse_args(argc, argv, args)){
        fprintf(stderr, "%s", kUsage);
        return 2;
    }
    try {
        return run(args);
    } catch (const SignatureMismatchError& ex){
        fprintf(stderr, "Error: possible tampering: %s\n", ex.what());
    } catch (const SecmanError& ex){
        fprintf(stderr, "Error: %s\n", ex.what());
    } catch (const std::exception& ex){
        fprintf(stderr, "Fatal error: %s\n", ex.what());
    }
    return 1;
}

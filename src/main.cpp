// TermCfg checker: parses config files (or an interactive prompt) and prints
// the resulting commands and diagnostics.
#include <termcfg/parse/parser.hpp>
#include <termcfg/parse/registry.hpp>
#include <termcfg/parse/command.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace termcfg;

struct CheckConfig {
    bool color = true;
    bool debug = false;            // show [DEBUG] diagnostics
    bool json = false;             // print commands as JSON
    std::string prompt = "termcfg> ";
};
static CheckConfig g_cfg;

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }
static bool parse_bool(const std::string& v){ return v=="1"||v=="true"||v=="on"||v=="yes"; }
static std::string apply_color(const std::string& s, const char* code){ if(!g_cfg.color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

static void load_config(){
    std::string home=getenv_or("HOME"); if(home.empty()) return;
    std::ifstream in(home+"/.termcfgrc"); if(!in) return;
    std::string line; size_t lineno=0;
    while(std::getline(in,line)){
        ++lineno;
        if(line.empty()||line[0]=='#') continue;
        auto eq=line.find('='); if(eq==std::string::npos) continue;
        auto key=line.substr(0,eq); auto val=line.substr(eq+1);
        if(key=="color") g_cfg.color=parse_bool(val);
        else if(key=="debug") g_cfg.debug=parse_bool(val);
        else if(key=="json") g_cfg.json=parse_bool(val);
        else if(key=="prompt") g_cfg.prompt=val;
        else std::cerr << "[termcfg] ~/.termcfgrc:" << lineno << ": unknown key '" << key << "'\n";
    }
}

static void print_usage(std::ostream& os){
    os << "Usage: termcfg-check [options] [FILE...]\n"
       << "  -d, --debug          show parser diagnostics\n"
       << "      --json           print commands as JSON\n"
       << "      --no-color       disable colored output\n"
       << "      --list-commands  print the supported commands\n"
       << "  -h, --help           show this help\n"
       << "Without FILE, reads standard input (interactive prompt on a terminal).\n";
}

static void print_command(const Command& cmd){
    if(g_cfg.json) std::cout << to_json(cmd) << "\n";
    else std::cout << apply_color(describe(cmd),"32") << "\n";
}

static void print_error(const ConfigError& err){
    std::cerr << apply_color("error:","1;31") << " " << err.str() << "\n";
}

// Parses a whole stream in order; returns the number of errors reported.
static size_t check_stream(std::istream& in, const std::string& source){
    ConfigParser parser(in, source);
    size_t commands=0, errors=0;
    while(true){
        auto r = parser.parse();
        if(r.command){ print_command(*r.command); ++commands; }
        if(r.error){
            print_error(*r.error); ++errors;
            if(r.error->kind==ErrorKind::Scanner) break;
        }
        if(r.eof) break;
    }
    if(g_cfg.debug) std::cerr << "[DEBUG] " << parser.input_source() << ": " << commands << " command(s), " << errors << " error(s)\n";
    return errors;
}

// Interactive prompt: each line is parsed on its own with no source label.
static size_t run_prompt(){
    size_t errors=0; std::string line;
    while(true){
        std::cout << g_cfg.prompt << std::flush;
        if(!std::getline(std::cin,line)) { std::cout << "\n"; break; }
        auto notspace = [](char ch){ return !std::isspace(static_cast<unsigned char>(ch)); };
        if(std::find_if(line.begin(), line.end(), notspace)==line.end()) continue;
        std::istringstream iss(line);
        ConfigParser parser(iss, "");
        bool quit=false;
        while(true){
            auto r = parser.parse();
            if(r.command){
                if(g_cfg.debug) std::cerr << "[DEBUG] parsed '" << command_name(*r.command) << "'\n";
                print_command(*r.command);
                if(std::holds_alternative<QuitCommand>(*r.command)) quit=true;
            }
            if(r.error){
                print_error(*r.error); ++errors;
                if(r.error->kind==ErrorKind::Scanner) break;
            }
            if(r.eof) break;
        }
        if(quit) break;
    }
    return errors;
}

int main(int argc, char* argv[]){
    load_config();
    std::vector<std::string> files; bool list_commands=false;
    for(int i=1;i<argc;++i){
        std::string a=argv[i];
        if(a=="-d"||a=="--debug") g_cfg.debug=true;
        else if(a=="--json") g_cfg.json=true;
        else if(a=="--no-color") g_cfg.color=false;
        else if(a=="--list-commands") list_commands=true;
        else if(a=="-h"||a=="--help"){ print_usage(std::cout); return 0; }
        else if(a.size()>1 && a[0]=='-'){ std::cerr << "termcfg-check: unknown option '" << a << "'\n"; print_usage(std::cerr); return 2; }
        else files.push_back(a);
    }
    if(!isatty(STDOUT_FILENO) || !isatty(STDERR_FILENO)) g_cfg.color=false;

    if(list_commands){
        const auto& reg = CommandRegistry::defaults();
        for(auto &name: reg.names()){
            const auto* d = reg.find(name);
            std::cout << apply_color(name,"36") << "\t" << d->usage << "\n";
        }
        return 0;
    }

    size_t errors=0;
    if(files.empty()){
        if(isatty(STDIN_FILENO)) errors = run_prompt();
        else errors = check_stream(std::cin, "<stdin>");
    } else {
        for(auto &path: files){
            std::ifstream in(path);
            if(!in){ std::perror(("open " + path).c_str()); return 2; }
            errors += check_stream(in, path);
        }
    }
    if(g_cfg.debug) std::cerr << "[DEBUG] total errors: " << errors << "\n";
    return errors==0 ? 0 : 1;
}

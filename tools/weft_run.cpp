#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "curlite/curlite.hpp"
#include "pylite/pylite.hpp"
#include "weft/canon/edn_form.hpp"
#include "weft/diagnostics.hpp"

static std::string read_all(std::istream& is){
    std::ostringstream ss; ss << is.rdbuf(); return ss.str();
}

static bool ends_with(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static int usage(){
    std::cerr << "usage: weft_run <file> [--lang pylite|curlite] [--dump-canon]\n";
    return 1;
}

int main(int argc, char** argv){
    std::string path, lang;
    bool dumpCanon = false;
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if(a == "--lang"){
            if(i + 1 >= argc) return usage();
            lang = argv[++i];
        } else if(a == "--dump-canon"){
            dumpCanon = true;
        } else if(!a.empty() && a[0] == '-'){
            std::cerr << "weft_run: unknown option '" << a << "'\n";
            return usage();
        } else if(path.empty()){
            path = a;
        } else {
            return usage();
        }
    }
    if(path.empty()) return usage();
    if(lang.empty()){
        if(ends_with(path, ".pyl")) lang = "pylite";
        else if(ends_with(path, ".crl")) lang = "curlite";
        else { std::cerr << "weft_run: cannot tell the language of '" << path << "'; pass --lang\n"; return 1; }
    }
    if(lang != "pylite" && lang != "curlite"){
        std::cerr << "weft_run: unknown language '" << lang << "'\n";
        return 1;
    }

    std::ifstream f(path, std::ios::binary);
    if(!f){ std::cerr << "weft_run: cannot open '" << path << "'\n"; return 1; }
    const std::string src = read_all(f);

    weft::RunOptions opts;
    if(dumpCanon){
        if(lang != "curlite"){ std::cerr << "weft_run: --dump-canon needs a schema-driven language (curlite)\n"; return 1; }
        try {
            std::cout << weft::edn::to_pretty_string(weft::canon::to_edn(weft::canon::compile(curlite::language(), src))) << "\n";
            return 0;
        } catch(const weft::error& e) {
            std::cerr << weft::format_diagnostic(weft::to_diagnostic(e, src), path) << "\n";
            return 2;
        }
    }

    auto res = lang == "pylite" ? pylite::run(src, opts) : curlite::run(src, opts);
    for(auto& d : res.diagnostics) std::cerr << weft::format_diagnostic(d, path) << "\n";
    return res.exit_code();
}

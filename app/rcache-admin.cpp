#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <rcache/config/properties.hpp>
#include <rcache/region/region_factory.hpp>

using namespace rcache;

static void usage() {
    std::cout <<
        "Usage: rcache-admin [-h host] [-p port] [-c file.properties] <command> [args]\n"
        "  ping | dbsize | flush\n"
        "  keys <region> | size <region>\n"
        "  get <region> <key>\n"
        "  put <region> <key> <json> [ttl-seconds]\n"
        "  del <region> <key>\n"
        "  sweep <region>...\n"
        "  next-ts [counter-key]\n";
}

static int run(RegionFactory& factory, const std::vector<std::string>& cmd) {
    const std::string& op = cmd[0];
    auto need = [&](size_t n) {
        if (cmd.size() < n) throw std::invalid_argument(op + ": missing arguments");
    };

    if (op == "ping") {
        std::cout << factory.client().ping() << "\n";
    }
    else if (op == "dbsize") {
        std::cout << "(integer) " << factory.client().db_size() << "\n";
    }
    else if (op == "flush") {
        factory.flush();
        std::cout << "OK\n";
    }
    else if (op == "keys") {
        need(2);
        auto keys = factory.build_region(cmd[1])->keys();
        if (keys.empty()) std::cout << "(empty)\n";
        for (size_t i = 0; i < keys.size(); ++i) std::cout << i + 1 << ") \"" << keys[i] << "\"\n";
    }
    else if (op == "size") {
        need(2);
        std::cout << "(integer) " << factory.build_region(cmd[1])->size() << "\n";
    }
    else if (op == "get") {
        need(3);
        auto v = factory.build_region(cmd[1])->get(cmd[2]);
        std::cout << (v ? v->dump() : "(nil)") << "\n";
    }
    else if (op == "put") {
        need(4);
        auto region = factory.build_region(cmd[1]);
        Value v = Value::parse(cmd[3]);
        if (cmd.size() > 4) region->put(cmd[2], v, std::stoll(cmd[4]));
        else region->put(cmd[2], v);
        std::cout << "OK\n";
    }
    else if (op == "del") {
        need(3);
        factory.build_region(cmd[1])->remove(cmd[2]);
        std::cout << "OK\n";
    }
    else if (op == "sweep") {
        need(2);
        for (size_t i = 1; i < cmd.size(); ++i) {
            std::cout << cmd[i] << ": " << factory.sweeper().sweep_region(cmd[i]) << " purged\n";
        }
    }
    else if (op == "next-ts") {
        long long ts = cmd.size() > 1 ? factory.timestamper().next(cmd[1]) : factory.next_timestamp();
        std::cout << "(integer) " << ts << "\n";
    }
    else {
        std::cerr << "unknown command: " << op << "\n";
        usage();
        return 2;
    }
    return 0;
}

int main(int argc, char** argv) {
    Properties props;
    Properties cli;
    std::vector<std::string> cmd;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (!cmd.empty()) { cmd.push_back(a); continue; }
        if ((a == "-h" || a == "--host") && i + 1 < argc) { cli.set(keys::kHost, argv[++i]); }
        else if ((a == "-p" || a == "--port") && i + 1 < argc) { cli.set(keys::kPort, argv[++i]); }
        else if ((a == "-c" || a == "--config") && i + 1 < argc) {
            try {
                props = Properties::load(argv[++i]);
            }
            catch (const std::exception& e) {
                std::cerr << e.what() << "\n";
                return 2;
            }
        }
        else if (a == "-?" || a == "--help") { usage(); return 0; }
        else cmd.push_back(a);
    }
    if (cmd.empty()) { usage(); return 2; }

    cli.set(keys::kLogLevel, props.get(keys::kLogLevel, "warn"));
    RegionFactory factory(props.with_overrides(cli));
    try {
        factory.start();
        int rc = run(factory, cmd);
        factory.stop();
        return rc;
    }
    catch (const std::exception& e) {
        std::cerr << "(error) " << e.what() << "\n";
    }
    factory.stop();
    return 1;
}

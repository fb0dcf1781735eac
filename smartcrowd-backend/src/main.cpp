#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "core/config.hpp"
#include "core/database.hpp"
#include "pipeline/pipeline_runner.hpp"
#include "snapshot/snapshot_builder.hpp"

namespace asio = boost::asio;

void print_usage(const char *prog) {
  std::cout << "用法: " << prog << " --config <config.json> <command> [args]" << std::endl;
  std::cout << "  recompute                 metrics → weights → snapshots" << std::endl;
  std::cout << "  snapshot <market_id>      单市场快照 (持久化)" << std::endl;
  std::cout << "  backtest [hours] [run_id] 单一 cutoff 回测" << std::endl;
  std::cout << "  sweep [max_hours]         cutoff 1..max_hours 扫描" << std::endl;
  std::cout << "  screener [limit]          最新快照按 |divergence| 排序" << std::endl;
  std::cout << "  runs                      最近的 pipeline 运行记录" << std::endl;
  std::cout << "  serve                     周期性 recompute" << std::endl;
}

int serve(pipeline::Runner &runner, const Config &config) {
  asio::io_context ioc;
  pipeline::RecomputeScheduler scheduler(runner, config.recompute_interval_seconds);

  asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](boost::system::error_code, int sig) {
    std::cout << "[Main] 收到信号 " << sig << ", 退出" << std::endl;
    scheduler.stop();
    ioc.stop();
  });

  scheduler.start(ioc);
  ioc.run();
  return 0;
}

int run_command(const std::string &command, const std::vector<std::string> &args, Database &db,
                const Config &config) {
  pipeline::Runner runner(db, config);

  if (command == "recompute") {
    std::cout << runner.recompute().dump(2) << std::endl;
  } else if (command == "snapshot") {
    if (args.empty()) {
      std::cerr << "[Main] snapshot 需要 market_id" << std::endl;
      return 2;
    }
    auto snap = snapshot::build_market_snapshot(db, args[0], std::nullopt, true, config.half_life_hours);
    std::cout << snap.to_json().dump(2) << std::endl;
  } else if (command == "backtest") {
    double hours = args.size() > 0 ? std::stod(args[0]) : config.backtest_cutoff_hours;
    std::optional<std::string> run_id;
    if (args.size() > 1)
      run_id = args[1];
    auto result = runner.backtest(hours, run_id);
    auto id = result["backtest_run_id"].get<std::string>();
    auto report = db.query_json("SELECT summary_json FROM backtest_reports WHERE run_id = " + schema::escape_sql(id));
    std::cout << json::parse(report.at(0)["summary_json"].get<std::string>()).dump(2) << std::endl;
  } else if (command == "sweep") {
    int max_hours = args.size() > 0 ? std::stoi(args[0]) : config.sweep_max_hours;
    std::cout << runner.sweep(max_hours).dump(2) << std::endl;
  } else if (command == "screener") {
    int limit = args.size() > 0 ? std::stoi(args[0]) : config.screener_limit;
    std::cout << snapshot::latest_screener_rows(db, limit).dump(2) << std::endl;
  } else if (command == "runs") {
    json out = {
        {"runs", runner.tracker().recent_runs()},
        {"system_metrics", runner.tracker().system_metrics()},
    };
    std::cout << out.dump(2) << std::endl;
  } else if (command == "serve") {
    return serve(runner, config);
  } else {
    std::cerr << "[Main] 未知命令: " << command << std::endl;
    return 2;
  }
  return 0;
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";
  std::string command;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else if (command.empty()) {
      command = argv[i];
    } else {
      args.emplace_back(argv[i]);
    }
  }

  if (command.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    SmartCrowd Backend" << std::endl;
  std::cout << "========================================" << std::endl;

  try {
    Config config = Config::load(config_path);
    std::cout << "[Main] DB Path: " << config.db_path << std::endl;
    std::cout << "[Main] Half-life: " << config.half_life_hours << "h" << std::endl;

    Database db(config.db_path);
    db.init_schema();
    return run_command(command, args, db, config);
  } catch (const snapshot::UnknownMarketError &e) {
    std::cerr << "[Main] " << e.what() << std::endl;
    return 3;
  } catch (const std::exception &e) {
    std::cerr << "[Main] 错误: " << e.what() << std::endl;
    return 1;
  }
}

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <ferry/access/access_control.hpp>
#include <ferry/bridge/ledger.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <ferry/token/token_book.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_relocation(ferry::schema::nonce_t nonce,
                      const ferry::schema::relocation_t& entry) {
  std::cout << "  #" << nonce << " status=" << to_string(entry.status)
            << " token=" << ferry::schema::to_hex(entry.token)
            << " account=" << ferry::schema::to_hex(entry.account)
            << " amount=" << ferry::schema::to_string(entry.amount)
            << " fee=" << ferry::schema::to_string(entry.fee);
  if (entry.old_nonce != 0) {
    std::cout << " old_nonce=" << entry.old_nonce;
  }
  if (entry.new_nonce != 0) {
    std::cout << " new_nonce=" << entry.new_nonce;
  }
  std::cout << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto token_hex = std::string{};
  auto chain_id = ferry::schema::chain_id_t{};
  auto first_nonce = ferry::schema::nonce_t{};
  auto count = uint64_t{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Ferry"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "ferry.db"),
      "RocksDB directory of the ledger")(
      "chain-id,c",
      boost::program_options::value<ferry::schema::chain_id_t>(&chain_id),
      "Only show this chain")(
      "from,f",
      boost::program_options::value<ferry::schema::nonce_t>(&first_nonce)
          ->default_value(1),
      "First relocation nonce to list")(
      "count,n", boost::program_options::value<uint64_t>(&count)->default_value(10),
      "Number of relocations to list per chain")(
      "token,t", boost::program_options::value<std::string>(&token_hex),
      "Also show the bridge modes of this token (64 hex digits)")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "ferry.log"),
      "Log file")("verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto token = std::optional<ferry::schema::asset_id_t>{};
  if (vm.contains("token")) {
    token = ferry::schema::try_make_hash32(token_hex);
    if (!token) {
      std::cerr << "invalid token id '" << token_hex << "'\n";
      return 1;
    }
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "ferry", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  auto storage =
      ferry::storage::make_storage<ferry::storage::rocksdb_storage_tag>(
          db_path);
  auto encoder = ferry::schema::encoding::encoder<
      ferry::schema::encoding::scale_encoder_tag>{};
  auto tokens = ferry::token::token_book{};
  auto access = ferry::access::access_control{ferry::schema::make_zero_hash()};
  auto ledger = ferry::bridge::ledger{storage, encoder, tokens, access,
                                      ferry::schema::make_zero_hash()};

  auto info = ledger.info();
  std::cout << info.data << ' ' << info.version << '\n'
            << "height: " << info.height << '\n'
            << "state root: " << ferry::schema::to_hex(info.state_root) << '\n'
            << "fee collector: "
            << ferry::schema::to_hex(ledger.fee_collector()) << '\n';

  auto chains = std::vector<ferry::schema::chain_id_t>{};
  if (vm.contains("chain-id")) {
    chains.push_back(chain_id);
  } else {
    chains = ledger.chains();
  }

  for (auto id : chains) {
    auto counters = ledger.counters(id);
    std::cout << "chain " << id
              << ": pending=" << counters.pending_relocation_count
              << " last_processed=" << counters.last_processed_relocation_nonce
              << " last_accommodation=" << counters.last_accommodation_nonce
              << '\n';
    if (token) {
      std::cout << "  token " << ferry::schema::to_hex(*token)
                << ": relocation="
                << to_string(ledger.relocation_mode(id, *token))
                << " accommodation="
                << to_string(ledger.accommodation_mode(id, *token)) << '\n';
    }
    auto entries = ledger.relocations(id, first_nonce, count);
    for (uint64_t i = 0; i < entries.size(); ++i) {
      if (entries[i].status == ferry::schema::relocation_status_t::nonexistent) {
        continue;
      }
      print_relocation(first_nonce + i, entries[i]);
    }
  }

  spdlog::shutdown();
  return 0;
}

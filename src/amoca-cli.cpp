// AMOCA CLI - Command Line Interface
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Operates a ledger stored in the data directory. Each mutating command
// loads the ledger, signs one transaction with the configured key, executes
// it and saves the ledger if it committed.

#include <amoca/core/error.h>
#include <amoca/core/hex.h>
#include <amoca/crypto/keys.h>
#include <amoca/db/database.h>
#include <amoca/ledger/clock.h>
#include <amoca/ledger/executor.h>
#include <amoca/ledger/ledger.h>
#include <amoca/ledger/store.h>
#include <amoca/ledger/transaction.h>
#include <amoca/util/config.h>
#include <amoca/util/logging.h>
#include <amoca/util/time.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace amoca;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_KEY_FILENAME = "amoca.key";
constexpr const char* LEDGER_DIRNAME = "ledger";
constexpr const char* LOG_FILENAME = "debug.log";

// ============================================================================
// Usage
// ============================================================================

void PrintVersion() {
    std::cout << "amoca-cli version " << VERSION << "\n";
}

void PrintUsage() {
    std::cout << "Usage: amoca-cli [options] <command> [args...]\n"
              << "\n"
              << "Commands:\n"
              << "  keygen                                Create a signing key in the data directory\n"
              << "  genesis                               Create a new ledger (treasury = -treasury or own key)\n"
              << "  mint <amount> [recipient]             Mint tokens (requires the mint authority)\n"
              << "  transfer <to> <amount>                Transfer tokens\n"
              << "  burn <amount>                         Destroy tokens from own account\n"
              << "  stake <amount> <duration>             Lock tokens (duration like 30d, 1y, 3600)\n"
              << "  claim <stake-id>                      Claim the reward of a matured stake\n"
              << "  unstake <stake-id>                    Release the principal of a matured stake\n"
              << "  propose <title> <duration> [text]     Open a governance proposal\n"
              << "  vote <proposal-id> <yes|no> <weight>  Vote on a proposal\n"
              << "  grant <data-id> <recipient> <level> <expiration>\n"
              << "                                        Issue a data access right; expiration is\n"
              << "                                        ISO8601, epoch seconds, or +duration\n"
              << "  verify <right-id> <level>             Check a data access right as own key\n"
              << "  authority <mint|pooladmin> <holder>   Hand an authority to another address\n"
              << "  balance [address]                     Show account balance\n"
              << "  show [pool|stakes|proposals|rights|authorities|<id>]\n"
              << "                                        Show ledger records\n"
              << "  events [from]                         Print the event log\n"
              << "\n"
              << "Options:\n"
              << "  -datadir=<dir>          Data directory (default: ~/.amoca)\n"
              << "  -conf=<file>            Configuration file (default: <datadir>/amoca.conf)\n"
              << "  -key=<hex>              Private key (default: read <datadir>/amoca.key)\n"
              << "  -keyfile=<file>         Private key file\n"
              << "  -treasury=<address>     Treasury address for genesis\n"
              << "  -rewardrate=<percent>   Annual staking reward for genesis (default: 5)\n"
              << "  -minstakeduration=<d>   Minimum stake duration for genesis (default: 7d)\n"
              << "  -mocktime=<seconds>     Use a fixed clock\n"
              << "  -loglevel=<level>       trace, debug, info, warn, error (default: warn)\n"
              << "  -debug=<category>       Debug logging for one category\n"
              << "  -printtoconsole         Log to stderr\n"
              << "  -version                Print version\n"
              << "  -help                   This help\n";
}

void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

std::optional<Address> ParseAddress(const std::string& str) {
    if (str.size() != Address::SIZE * 2 || !IsValidHex(str)) {
        return std::nullopt;
    }
    return Address::FromHex(str);
}

std::optional<ObjectId> ParseId(const std::string& str) {
    if (str.size() != ObjectId::SIZE * 2 || !IsValidHex(str)) {
        return std::nullopt;
    }
    return ObjectId::FromHex(str);
}

std::optional<uint64_t> ParseUInt(const std::string& str) {
    if (str.empty() || str.size() > 20) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (MAX_AMOUNT - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

// ============================================================================
// Setup
// ============================================================================

void SetupLogging(const util::ConfigManager& config, const fs::path& dataDir) {
    util::LogOptions options;
    options.level = util::LogLevelFromString(config.GetString(util::ConfigKeys::LOGLEVEL, "warn"));
    options.debugCategories = config.GetList(util::ConfigKeys::DEBUG);
    options.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false);

    std::error_code ec;
    if (fs::is_directory(dataDir, ec)) {
        options.filePath = config.GetPath(util::ConfigKeys::LOGFILE,
                                          (dataDir / LOG_FILENAME).string());
    }
    if (!util::ConfigureLogging(options)) {
        std::cerr << "warning: cannot open log file " << options.filePath << "\n";
    }
}

/// Everything a command needs
struct Context {
    util::ConfigManager config;
    fs::path dataDir;
    std::unique_ptr<db::Database> db;
    std::unique_ptr<ledger::Ledger> ledger;
};

bool EnsureDataDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        return true;
    }
    if (!fs::create_directories(dir, ec)) {
        std::cerr << "Error: Cannot create directory " << dir << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

/// Open the database and, if requireLedger, load the ledger from it
bool OpenLedger(Context& ctx, bool requireLedger) {
    if (!EnsureDataDir(ctx.dataDir)) {
        return false;
    }
    auto [status, db] = db::OpenDatabase(ctx.dataDir / LEDGER_DIRNAME);
    if (!status.ok()) {
        std::cerr << "Error: Cannot open ledger database: " << status.ToString() << "\n";
        return false;
    }
    ctx.db = std::move(db);

    if (!requireLedger) {
        return true;
    }

    ledger::LedgerStore store(*ctx.db);
    auto [loadStatus, loaded] = store.Load();
    if (loadStatus.IsNotFound()) {
        std::cerr << "Error: No ledger in " << ctx.dataDir << ". Run 'amoca-cli genesis' first.\n";
        return false;
    }
    if (!loadStatus.ok()) {
        std::cerr << "Error: Cannot load ledger: " << loadStatus.ToString() << "\n";
        return false;
    }
    ctx.ledger = std::move(loaded);
    return true;
}

fs::path KeyFilePath(const Context& ctx) {
    return ctx.config.GetPath(util::ConfigKeys::KEYFILE,
                              (ctx.dataDir / DEFAULT_KEY_FILENAME).string());
}

std::optional<PrivateKey> LoadKey(const Context& ctx) {
    std::string hex;
    if (auto inlineKey = ctx.config.TryGetString(util::ConfigKeys::KEY)) {
        hex = *inlineKey;
    } else {
        fs::path path = KeyFilePath(ctx);
        std::ifstream in(path);
        if (!in) {
            std::cerr << "Error: No key. Use -key=<hex> or run 'amoca-cli keygen'.\n";
            return std::nullopt;
        }
        std::getline(in, hex);
    }
    auto key = PrivateKey::FromHex(hex);
    if (!key || !key->IsValid()) {
        std::cerr << "Error: Invalid private key\n";
        return std::nullopt;
    }
    return key;
}

std::unique_ptr<ledger::Clock> MakeClock(const Context& ctx, Timestamp floor) {
    if (auto mock = ctx.config.TryGetInt(util::ConfigKeys::MOCKTIME)) {
        return std::make_unique<ledger::ManualClock>(*mock);
    }
    return std::make_unique<ledger::SystemClock>(floor);
}

/// Current ledger time as the next transaction would see it
Timestamp CurrentTime(const Context& ctx) {
    Timestamp floor = ctx.ledger ? ctx.ledger->GetLastTime() : 0;
    return std::max(MakeClock(ctx, floor)->Now(), floor);
}

// ============================================================================
// Transaction Submission
// ============================================================================

void PrintEvents(const std::vector<ledger::Event>& events) {
    for (const auto& event : events) {
        std::cout << event.ToString() << "\n";
    }
}

/// Sign, execute and persist one operation. Returns the process exit code.
int Submit(Context& ctx, ledger::Operation op, ledger::TxResult* out = nullptr) {
    auto key = LoadKey(ctx);
    if (!key) {
        return 1;
    }
    PublicKey pubkey = key->GetPublicKey();
    Address sender = pubkey.GetAddress();

    ledger::Transaction tx = ledger::MakeTransaction(
        pubkey, ctx.ledger->GetNextNonce(sender), std::move(op));
    if (!tx.Sign(*key)) {
        std::cerr << "Error: Signing failed\n";
        return 1;
    }

    auto clock = MakeClock(ctx, ctx.ledger->GetLastTime());
    ledger::Executor executor(*ctx.ledger, *clock);
    ledger::TxResult result = executor.Execute(tx);

    if (!result.committed) {
        std::cerr << "Error: " << ErrorCodeToString(result.error);
        if (!result.message.empty()) {
            std::cerr << ": " << result.message;
        }
        std::cerr << "\n";
        return 1;
    }

    ledger::LedgerStore store(*ctx.db);
    db::Status s = store.Save(*ctx.ledger);
    if (!s.ok()) {
        std::cerr << "Error: Committed but could not save: " << s.ToString() << "\n";
        return 1;
    }

    PrintEvents(result.events);
    if (out) {
        *out = std::move(result);
    }
    return 0;
}

// ============================================================================
// Commands
// ============================================================================

int CommandKeygen(Context& ctx) {
    if (!EnsureDataDir(ctx.dataDir)) {
        return 1;
    }
    fs::path path = KeyFilePath(ctx);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::cerr << "Error: Key file already exists at " << path << "\n";
        return 1;
    }

    PrivateKey key = PrivateKey::Generate();
    if (!key.IsValid()) {
        std::cerr << "Error: Key generation failed\n";
        return 1;
    }
    {
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            std::cerr << "Error: Cannot write " << path << "\n";
            return 1;
        }
        out << key.ToHex() << "\n";
    }
    ::chmod(path.c_str(), S_IRUSR | S_IWUSR);

    PublicKey pubkey = key.GetPublicKey();
    std::cout << "Key file:   " << path.string() << "\n";
    std::cout << "Public key: " << pubkey.ToHex() << "\n";
    std::cout << "Address:    " << pubkey.GetAddress().ToHex() << "\n";
    return 0;
}

int CommandGenesis(Context& ctx) {
    if (!OpenLedger(ctx, false)) {
        return 1;
    }
    ledger::LedgerStore store(*ctx.db);
    if (store.Exists()) {
        std::cerr << "Error: A ledger already exists in " << ctx.dataDir << "\n";
        return 1;
    }

    ledger::GenesisParams params;
    if (auto treasury = ctx.config.TryGetString(util::ConfigKeys::TREASURY)) {
        auto addr = ParseAddress(*treasury);
        if (!addr) {
            std::cerr << "Error: Invalid treasury address ("
                      << ctx.config.DescribeSource(util::ConfigKeys::TREASURY) << ")\n";
            return 1;
        }
        params.treasury = *addr;
    } else {
        auto key = LoadKey(ctx);
        if (!key) {
            return 1;
        }
        params.treasury = key->GetPublicKey().GetAddress();
    }

    params.rewardRate = ctx.config.GetUInt(util::ConfigKeys::REWARDRATE,
                                           staking::DEFAULT_REWARD_RATE);
    if (ctx.config.HasKey(util::ConfigKeys::MINSTAKEDURATION)) {
        auto minDuration = ctx.config.TryGetDuration(util::ConfigKeys::MINSTAKEDURATION);
        if (!minDuration) {
            std::cerr << "Error: Invalid minstakeduration ("
                      << ctx.config.DescribeSource(util::ConfigKeys::MINSTAKEDURATION) << ")\n";
            return 1;
        }
        params.minStakeDuration = *minDuration;
    }

    auto ledger = ledger::Ledger::Genesis(params, MakeClock(ctx, 0)->Now());
    db::Status s = store.Save(*ledger);
    if (!s.ok()) {
        std::cerr << "Error: Cannot save ledger: " << s.ToString() << "\n";
        return 1;
    }

    staking::StakingPool pool = ledger->Staking().GetPool();
    std::cout << "Ledger created in " << ctx.dataDir.string() << "\n";
    std::cout << "Treasury:        " << params.treasury.ToHex() << "\n";
    std::cout << "Staking pool:    " << pool.id.ToHex() << "\n";
    std::cout << "Reward rate:     " << pool.rewardRate << "%\n";
    std::cout << "Min stake:       " << util::FormatDuration(pool.minStakeDuration) << "\n";
    for (const auto& token : ledger->Gate().GetAll()) {
        std::cout << "Authority:       " << token.ToString() << "\n";
    }
    return 0;
}

int CommandMint(Context& ctx, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        std::cerr << "Usage: amoca-cli mint <amount> [recipient]\n";
        return 1;
    }
    Amount amount = 0;
    if (!ParseAmount(args[0], amount)) {
        std::cerr << "Error: Invalid amount\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    auto key = LoadKey(ctx);
    if (!key) {
        return 1;
    }
    Address self = key->GetPublicKey().GetAddress();

    ledger::MintTokens op;
    op.amount = amount;
    op.recipient = self;
    if (args.size() == 2) {
        auto recipient = ParseAddress(args[1]);
        if (!recipient) {
            std::cerr << "Error: Invalid recipient address\n";
            return 1;
        }
        op.recipient = *recipient;
    }

    // Present the mint authority we hold, if any; the gate decides
    auto held = ctx.ledger->Gate().FindByHolder(self);
    for (const auto& token : held) {
        if (token.capability == ledger::Capability::Mint) {
            op.authority = token;
            break;
        }
    }
    return Submit(ctx, op);
}

int CommandTransfer(Context& ctx, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: amoca-cli transfer <to> <amount>\n";
        return 1;
    }
    auto to = ParseAddress(args[0]);
    Amount amount = 0;
    if (!to || !ParseAmount(args[1], amount)) {
        std::cerr << "Error: Invalid address or amount\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    return Submit(ctx, ledger::TransferTokens{*to, amount});
}

int CommandBurn(Context& ctx, const std::vector<std::string>& args) {
    Amount amount = 0;
    if (args.size() != 1 || !ParseAmount(args[0], amount)) {
        std::cerr << "Usage: amoca-cli burn <amount>\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    return Submit(ctx, ledger::BurnTokens{amount});
}

int CommandStake(Context& ctx, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: amoca-cli stake <amount> <duration>\n";
        return 1;
    }
    Amount amount = 0;
    auto duration = util::ParseDuration(args[1]);
    if (!ParseAmount(args[0], amount) || !duration) {
        std::cerr << "Error: Invalid amount or duration\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    ledger::TxResult result;
    int rc = Submit(ctx, ledger::StakeTokens{amount, *duration}, &result);
    if (rc == 0 && result.createdId) {
        std::cout << "Stake id: " << result.createdId->ToHex() << "\n";
    }
    return rc;
}

int CommandClaim(Context& ctx, const std::vector<std::string>& args) {
    std::optional<ObjectId> id = args.size() == 1 ? ParseId(args[0]) : std::nullopt;
    if (!id) {
        std::cerr << "Usage: amoca-cli claim <stake-id>\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    ledger::TxResult result;
    int rc = Submit(ctx, ledger::ClaimRewards{*id}, &result);
    if (rc == 0) {
        std::cout << "Reward: " << FormatAmount(result.amount) << "\n";
    }
    return rc;
}

int CommandUnstake(Context& ctx, const std::vector<std::string>& args) {
    std::optional<ObjectId> id = args.size() == 1 ? ParseId(args[0]) : std::nullopt;
    if (!id) {
        std::cerr << "Usage: amoca-cli unstake <stake-id>\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    ledger::TxResult result;
    int rc = Submit(ctx, ledger::UnstakeTokens{*id}, &result);
    if (rc == 0) {
        std::cout << "Released: " << FormatAmount(result.amount) << "\n";
    }
    return rc;
}

int CommandPropose(Context& ctx, const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) {
        std::cerr << "Usage: amoca-cli propose <title> <duration> [description]\n";
        return 1;
    }
    auto duration = util::ParseDuration(args[1]);
    if (!duration) {
        std::cerr << "Error: Invalid duration\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    ledger::CreateProposal op;
    op.title = args[0];
    op.duration = *duration;
    if (args.size() == 3) {
        op.description = args[2];
    }
    ledger::TxResult result;
    int rc = Submit(ctx, op, &result);
    if (rc == 0 && result.createdId) {
        std::cout << "Proposal id: " << result.createdId->ToHex() << "\n";
    }
    return rc;
}

int CommandVote(Context& ctx, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        std::cerr << "Usage: amoca-cli vote <proposal-id> <yes|no> <weight>\n";
        return 1;
    }
    auto id = ParseId(args[0]);
    auto choice = governance::VoteChoiceFromString(args[1]);
    auto weight = ParseUInt(args[2]);
    if (!id || !choice || !weight) {
        std::cerr << "Error: Invalid proposal id, choice or weight\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    return Submit(ctx, ledger::VoteOnProposal{*id, *choice, *weight});
}

int CommandGrant(Context& ctx, const std::vector<std::string>& args) {
    if (args.size() != 4) {
        std::cerr << "Usage: amoca-cli grant <data-id> <recipient> <level> <expiration>\n";
        return 1;
    }
    auto recipient = ParseAddress(args[1]);
    auto level = ParseUInt(args[2]);
    if (!recipient || !level) {
        std::cerr << "Error: Invalid recipient or level\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    auto expiration = util::ParseInstant(args[3], CurrentTime(ctx));
    if (!expiration) {
        std::cerr << "Error: Invalid expiration\n";
        return 1;
    }
    ledger::TxResult result;
    int rc = Submit(ctx, ledger::CreateDataAccessRight{args[0], *recipient, *level, *expiration},
                    &result);
    if (rc == 0 && result.createdId) {
        std::cout << "Right id: " << result.createdId->ToHex() << "\n";
    }
    return rc;
}

int CommandVerify(Context& ctx, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: amoca-cli verify <right-id> <level>\n";
        return 1;
    }
    auto id = ParseId(args[0]);
    auto level = ParseUInt(args[1]);
    if (!id || !level) {
        std::cerr << "Error: Invalid right id or level\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    ledger::TxResult result;
    int rc = Submit(ctx, ledger::VerifyDataAccess{*id, *level}, &result);
    if (rc == 0) {
        bool ok = result.verified.value_or(false);
        std::cout << (ok ? "granted" : "denied") << "\n";
    }
    return rc;
}

int CommandAuthority(Context& ctx, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: amoca-cli authority <mint|pooladmin> <new-holder>\n";
        return 1;
    }
    auto capability = ledger::CapabilityFromString(args[0]);
    auto holder = ParseAddress(args[1]);
    if (!capability || !holder) {
        std::cerr << "Error: Invalid capability or address\n";
        return 1;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    auto token = ctx.ledger->FindAuthority(*capability);
    if (!token) {
        std::cerr << "Error: No " << args[0] << " authority registered\n";
        return 1;
    }
    return Submit(ctx, ledger::TransferAuthority{*token, *holder});
}

int CommandBalance(Context& ctx, const std::vector<std::string>& args) {
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    Address addr;
    if (args.empty()) {
        auto key = LoadKey(ctx);
        if (!key) {
            return 1;
        }
        addr = key->GetPublicKey().GetAddress();
    } else {
        auto parsed = ParseAddress(args[0]);
        if (!parsed) {
            std::cerr << "Error: Invalid address\n";
            return 1;
        }
        addr = *parsed;
    }

    Amount staked = 0;
    for (const auto& stake : ctx.ledger->Staking().ListStakesByOwner(addr)) {
        staked += stake.amount;
    }
    std::cout << "Address:   " << addr.ToHex() << "\n";
    std::cout << "Available: " << FormatAmount(ctx.ledger->Tokens().BalanceOf(addr)) << "\n";
    std::cout << "Staked:    " << FormatAmount(staked) << "\n";
    std::cout << "Nonce:     " << ctx.ledger->GetNextNonce(addr) << "\n";
    return 0;
}

void ShowStake(const staking::StakeInfo& stake, Timestamp now) {
    std::cout << "Stake " << stake.id.ToHex() << "\n"
              << "  owner:   " << stake.owner.ToHex() << "\n"
              << "  amount:  " << FormatAmount(stake.amount) << "\n"
              << "  start:   " << util::FormatISO8601(stake.startTime) << "\n"
              << "  end:     " << util::FormatISO8601(stake.endTime)
              << (stake.IsMatured(now) ? " (matured)" : "") << "\n"
              << "  claimed: " << (stake.claimed ? "yes" : "no") << "\n";
}

void ShowProposal(const governance::Proposal& p, Timestamp now) {
    std::cout << "Proposal " << p.id.ToHex() << "\n"
              << "  title:    " << p.title << "\n";
    if (!p.description.empty()) {
        std::cout << "  text:     " << p.description << "\n";
    }
    std::cout << "  proposer: " << p.proposer.ToHex() << "\n"
              << "  window:   " << util::FormatISO8601(p.startTime) << " .. "
              << util::FormatISO8601(p.endTime)
              << (p.IsVotingOpen(now) ? " (open)" : " (closed)") << "\n"
              << "  yes:      " << p.yesVotes << "\n"
              << "  no:       " << p.noVotes << "\n";
}

void ShowRight(const access::DataAccessRight& r, Timestamp now) {
    std::cout << "Access right " << r.id.ToHex() << "\n"
              << "  data:       " << r.dataId << "\n"
              << "  owner:      " << r.owner.ToHex() << "\n"
              << "  grantor:    " << r.grantor.ToHex() << "\n"
              << "  level:      " << r.accessLevel << "\n"
              << "  expiration: " << util::FormatISO8601(r.expiration)
              << (now > r.expiration ? " (expired)" : "") << "\n";
}

int CommandShow(Context& ctx, const std::vector<std::string>& args) {
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    const ledger::Ledger& l = *ctx.ledger;
    Timestamp now = CurrentTime(ctx);
    std::string what = args.empty() ? "" : args[0];

    if (what.empty() || what == "pool") {
        staking::StakingPool pool = l.Staking().GetPool();
        PrintLine('=');
        std::cout << "Ledger (genesis " << util::FormatISO8601(l.GetGenesisTime())
                  << ", last commit " << util::FormatISO8601(l.GetLastTime()) << ")\n";
        PrintLine('=');
        std::cout << "Total supply:  " << FormatAmount(l.Tokens().TotalSupply()) << "\n";
        std::cout << "Accounts:      " << l.Tokens().GetAccounts().size() << "\n";
        std::cout << "Pool:          " << pool.id.ToHex() << "\n";
        std::cout << "Total staked:  " << FormatAmount(pool.totalStaked) << "\n";
        std::cout << "Reward rate:   " << pool.rewardRate << "%\n";
        std::cout << "Min stake:     " << util::FormatDuration(pool.minStakeDuration) << "\n";
        std::cout << "Stakes:        " << l.Staking().ListStakes().size() << "\n";
        std::cout << "Proposals:     " << l.Governance().ListProposals().size() << "\n";
        std::cout << "Access rights: " << l.Access().GetAll().size() << "\n";
        std::cout << "Events:        " << l.Events().Size() << "\n";
        return 0;
    }
    if (what == "stakes") {
        for (const auto& stake : l.Staking().ListStakes()) {
            ShowStake(stake, now);
        }
        return 0;
    }
    if (what == "proposals") {
        for (const auto& p : l.Governance().ListProposals()) {
            ShowProposal(p, now);
        }
        return 0;
    }
    if (what == "rights") {
        for (const auto& r : l.Access().GetAll()) {
            ShowRight(r, now);
        }
        return 0;
    }
    if (what == "authorities") {
        for (const auto& token : l.Gate().GetAll()) {
            std::cout << token.ToString() << "\n";
        }
        return 0;
    }

    auto id = ParseId(what);
    if (!id) {
        std::cerr << "Error: Unknown record kind or id: " << what << "\n";
        return 1;
    }
    if (auto stake = l.Staking().GetStake(*id)) {
        ShowStake(*stake, now);
    } else if (auto proposal = l.Governance().GetProposal(*id)) {
        ShowProposal(*proposal, now);
    } else if (auto right = l.Access().Get(*id)) {
        ShowRight(*right, now);
    } else if (auto token = l.Gate().Get(*id)) {
        std::cout << token->ToString() << "\n";
    } else {
        std::cerr << "Error: " << ErrorCodeToString(ErrorCode::NotFound) << ": " << what << "\n";
        return 1;
    }
    return 0;
}

int CommandEvents(Context& ctx, const std::vector<std::string>& args) {
    uint64_t from = 0;
    if (!args.empty()) {
        auto parsed = ParseUInt(args[0]);
        if (!parsed) {
            std::cerr << "Usage: amoca-cli events [from]\n";
            return 1;
        }
        from = *parsed;
    }
    if (!OpenLedger(ctx, true)) {
        return 1;
    }
    PrintEvents(ctx.ledger->Events().Since(from));
    return 0;
}

// ============================================================================
// Main
// ============================================================================

int Dispatch(Context& ctx, const std::string& command, const std::vector<std::string>& args) {
    if (command == "keygen") {
        return CommandKeygen(ctx);
    } else if (command == "genesis") {
        return CommandGenesis(ctx);
    } else if (command == "mint") {
        return CommandMint(ctx, args);
    } else if (command == "transfer") {
        return CommandTransfer(ctx, args);
    } else if (command == "burn") {
        return CommandBurn(ctx, args);
    } else if (command == "stake") {
        return CommandStake(ctx, args);
    } else if (command == "claim") {
        return CommandClaim(ctx, args);
    } else if (command == "unstake") {
        return CommandUnstake(ctx, args);
    } else if (command == "propose") {
        return CommandPropose(ctx, args);
    } else if (command == "vote") {
        return CommandVote(ctx, args);
    } else if (command == "grant") {
        return CommandGrant(ctx, args);
    } else if (command == "verify") {
        return CommandVerify(ctx, args);
    } else if (command == "authority") {
        return CommandAuthority(ctx, args);
    } else if (command == "balance") {
        return CommandBalance(ctx, args);
    } else if (command == "show") {
        return CommandShow(ctx, args);
    } else if (command == "events") {
        return CommandEvents(ctx, args);
    } else if (command == "help") {
        PrintUsage();
        return 0;
    }
    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'amoca-cli help' for usage.\n";
    return 1;
}

int main(int argc, char* argv[]) {
    Context ctx;

    util::ConfigParseResult parsed = ctx.config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    if (ctx.config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }

    const std::vector<std::string>& positional = ctx.config.GetArgs();
    if (ctx.config.GetBool("help", false) || positional.empty()) {
        PrintUsage();
        return positional.empty() && !ctx.config.GetBool("help", false) ? 1 : 0;
    }

    ctx.dataDir = ctx.config.GetPath(util::ConfigKeys::DATADIR,
                                     util::ConfigManager::GetDefaultDataDir());

    std::string confPath = ctx.config.GetPath(
        util::ConfigKeys::CONF, (ctx.dataDir / util::DEFAULT_CONFIG_FILENAME).string());
    std::error_code ec;
    if (fs::exists(confPath, ec)) {
        util::ConfigParseResult fileResult = ctx.config.ParseFile(confPath);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.ToString() << "\n";
            return 1;
        }
    }

    SetupLogging(ctx.config, ctx.dataDir);

    std::string command = positional[0];
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    LOG_DEBUG(util::LogCategory::DEFAULT) << "amoca-cli " << VERSION << " " << command
                                          << " (datadir " << ctx.dataDir.string() << ")";

    int rc = 1;
    try {
        rc = Dispatch(ctx, command, args);
    } catch (const LedgerError& e) {
        std::cerr << "Error: " << ErrorCodeToString(e.Code()) << ": " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Unhandled error: " << e.what();
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    util::Logger::Instance().Shutdown();
    return rc;
}

#include "shared_price_table.H"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <new>
#include <thread>

namespace tickpipe::store {

namespace {

// how long to wait for another process to finish sizing or initializing a segment
constexpr int WAIT_ATTEMPTS = 100;
constexpr std::chrono::milliseconds WAIT_STEP{10};

std::string to_posix_name(const std::string& name) {
    std::string path = (!name.empty() && name[0] == '/') ? name : "/" + name;
    if (path.size() < 2 || path.find('/', 1) != std::string::npos) {
        throw std::invalid_argument("Invalid shared memory name '" + name + "'");
    }
    return path;
}

// -1 on error, otherwise the segment size once it reaches min_size (or the last size seen)
off_t wait_for_size(int fd, off_t min_size) {
    struct stat st;
    for (int i = 0; i < WAIT_ATTEMPTS; ++i) {
        if (fstat(fd, &st) == -1) {
            return -1;
        }
        if (st.st_size >= min_size) {
            return st.st_size;
        }
        std::this_thread::sleep_for(WAIT_STEP);
    }
    return st.st_size;
}

bool wait_until_ready(const lock_block* block) {
    for (int i = 0; i < WAIT_ATTEMPTS; ++i) {
        if (block->state.load(std::memory_order_acquire) == static_cast<uint32_t>(LOCK_STATE::READY)) {
            return true;
        }
        std::this_thread::sleep_for(WAIT_STEP);
    }
    return false;
}

class mutex_guard {
public:
    mutex_guard(lock_block* block, spdlog::logger& logger) : mutex(&block->mutex) {
        int rc = pthread_mutex_lock(mutex);
        if (rc == EOWNERDEAD) {
            // a single double store cannot be torn, so the table is still usable
            logger.warn("Previous holder of the price table lock died, recovering");
            pthread_mutex_consistent(mutex);
        } else if (rc != 0) {
            throw std::runtime_error("Failed to lock price table: " + std::string(strerror(rc)));
        }
    }

    ~mutex_guard() {
        pthread_mutex_unlock(mutex);
    }

    mutex_guard(const mutex_guard&) = delete;
    mutex_guard& operator=(const mutex_guard&) = delete;

private:
    pthread_mutex_t* mutex;
};

} // namespace

SharedPriceTable::SharedPriceTable(std::string name, bool creator, std::shared_ptr<spdlog::logger> logger)
    : segment_name(std::move(name)), creator(creator), logger(logger) {
    table_path = to_posix_name(segment_name);
    lock_path = table_path + ".lock";
}

SharedPriceTable::SharedPriceTable(SharedPriceTable&& other) noexcept
    : segment_name(std::move(other.segment_name)),
      table_path(std::move(other.table_path)),
      lock_path(std::move(other.lock_path)),
      creator(other.creator),
      unlinked(other.unlinked),
      entries(other.entries),
      entry_count(other.entry_count),
      lock(other.lock),
      symbol_names(std::move(other.symbol_names)),
      symbol_to_index(std::move(other.symbol_to_index)),
      logger(other.logger) {
    other.entries = nullptr;
    other.entry_count = 0;
    other.lock = nullptr;
    other.creator = false;
    other.unlinked = true;
}

SharedPriceTable::~SharedPriceTable() {
    close();
}

SharedPriceTable SharedPriceTable::create(const std::string& name, const std::vector<std::string>& symbols,
                                          std::shared_ptr<spdlog::logger> logger) {
    if (symbols.empty()) {
        throw std::invalid_argument("Cannot create a price table without symbols");
    }
    for (const auto& symbol : symbols) {
        if (symbol.empty() || symbol.size() > MAX_SYMBOL_BYTES) {
            throw std::invalid_argument("Symbol '" + symbol + "' does not fit the price table");
        }
    }

    SharedPriceTable table(name, true, logger);
    table.open_lock(true);

    int fd = shm_open(table.table_path.c_str(), O_CREAT | O_EXCL | O_RDWR, 0666);
    if (fd == -1) {
        if (errno != EEXIST) {
            throw std::runtime_error("Failed to create shared memory block " + table.table_path + ": "
                + std::string(strerror(errno)));
        }

        // left behind by a previous run or created by another handle
        logger->warn("Shared memory block '{}' already exists. Attaching...", name);
        table.open_existing_table();
        if (table.symbol_names != symbols) {
            table.close();
            throw std::runtime_error("Shared memory block '" + name + "' has a different symbol layout");
        }
        return table;
    }

    size_t size = segment_size(symbols.size());
    if (ftruncate(fd, static_cast<off_t>(size)) == -1) {
        int err = errno;
        ::close(fd);
        shm_unlink(table.table_path.c_str());
        throw std::runtime_error("Failed to size shared memory block " + table.table_path + ": " + strerror(err));
    }

    void* ptr = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    int err = errno;
    ::close(fd);
    if (ptr == MAP_FAILED) {
        shm_unlink(table.table_path.c_str());
        throw std::runtime_error("Failed to map shared memory block " + table.table_path + ": " + strerror(err));
    }

    table.entries = static_cast<price_entry*>(ptr);
    table.entry_count = symbols.size();

    {
        mutex_guard guard(table.lock, *logger);
        for (size_t i = 0; i < symbols.size(); ++i) {
            std::memset(table.entries[i].symbol, 0, MAX_SYMBOL_BYTES);
            std::memcpy(table.entries[i].symbol, symbols[i].data(), symbols[i].size());
            table.entries[i].price = 0.0;
        }
    }

    table.load_symbol_index();
    logger->info("Created shared memory block '{}': symbols={} footprint={} bytes", name, symbols.size(), size);
    return table;
}

SharedPriceTable SharedPriceTable::attach(const std::string& name, std::shared_ptr<spdlog::logger> logger) {
    SharedPriceTable table(name, false, logger);
    table.open_lock(false);
    table.open_existing_table();

    logger->info("Attached to shared memory block '{}' ({} symbols)", name, table.entry_count);
    return table;
}

bool SharedPriceTable::open_lock(bool allow_create) {
    int fd = -1;
    bool fresh = false;

    if (allow_create) {
        fd = shm_open(lock_path.c_str(), O_CREAT | O_EXCL | O_RDWR, 0666);
        if (fd != -1) {
            fresh = true;
        } else if (errno != EEXIST) {
            throw std::runtime_error("Failed to create lock segment " + lock_path + ": " + std::string(strerror(errno)));
        }
    }

    if (fd == -1) {
        fd = shm_open(lock_path.c_str(), O_RDWR, 0);
        if (fd == -1) {
            if (errno == ENOENT) {
                throw segment_not_found("Shared memory block '" + segment_name + "' not found");
            }
            throw std::runtime_error("Failed to open lock segment " + lock_path + ": " + std::string(strerror(errno)));
        }
    }

    if (fresh) {
        if (ftruncate(fd, sizeof(lock_block)) == -1) {
            int err = errno;
            ::close(fd);
            shm_unlink(lock_path.c_str());
            throw std::runtime_error("Failed to size lock segment " + lock_path + ": " + strerror(err));
        }
    } else if (wait_for_size(fd, sizeof(lock_block)) < static_cast<off_t>(sizeof(lock_block))) {
        ::close(fd);
        throw std::runtime_error("Lock segment " + lock_path + " has an invalid size");
    }

    void* ptr = mmap(nullptr, sizeof(lock_block), PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    int err = errno;
    ::close(fd);
    if (ptr == MAP_FAILED) {
        throw std::runtime_error("Failed to map lock segment " + lock_path + ": " + strerror(err));
    }
    lock = static_cast<lock_block*>(ptr);

    if (!fresh && wait_until_ready(lock)) {
        return false;
    }

    if (!allow_create) {
        throw std::runtime_error("Lock for shared memory block '" + segment_name + "' was never initialized");
    }

    if (!fresh) {
        logger->warn("Lock for shared memory block '{}' was left uninitialized, resetting it", segment_name);
    }

    new (&lock->state) std::atomic<uint32_t>(static_cast<uint32_t>(LOCK_STATE::UNINITIALIZED));

    pthread_mutexattr_t attr;
    pthread_mutexattr_init(&attr);
    pthread_mutexattr_setpshared(&attr, PTHREAD_PROCESS_SHARED);
    pthread_mutexattr_setrobust(&attr, PTHREAD_MUTEX_ROBUST);
    int rc = pthread_mutex_init(&lock->mutex, &attr);
    pthread_mutexattr_destroy(&attr);
    if (rc != 0) {
        throw std::runtime_error("Failed to initialize price table lock: " + std::string(strerror(rc)));
    }

    lock->state.store(static_cast<uint32_t>(LOCK_STATE::READY), std::memory_order_release);
    return true;
}

void SharedPriceTable::open_existing_table() {
    int fd = shm_open(table_path.c_str(), O_RDWR, 0);
    if (fd == -1) {
        if (errno == ENOENT) {
            logger->error("Shared memory block '{}' not found. Is the price relay running?", segment_name);
            throw segment_not_found("Shared memory block '" + segment_name + "' not found");
        }
        throw std::runtime_error("Failed to open shared memory block " + table_path + ": " + std::string(strerror(errno)));
    }

    off_t size = wait_for_size(fd, sizeof(price_entry));
    if (size <= 0 || size % sizeof(price_entry) != 0) {
        ::close(fd);
        throw std::runtime_error("Shared memory block " + table_path + " has an invalid size "
            + std::to_string(size));
    }

    void* ptr = mmap(nullptr, static_cast<size_t>(size), PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    int err = errno;
    ::close(fd);
    if (ptr == MAP_FAILED) {
        throw std::runtime_error("Failed to map shared memory block " + table_path + ": " + strerror(err));
    }

    entries = static_cast<price_entry*>(ptr);
    entry_count = static_cast<size_t>(size) / sizeof(price_entry);

    // the creator may still be writing the symbol fields
    for (int i = 0; i < WAIT_ATTEMPTS; ++i) {
        if (load_symbol_index()) {
            return;
        }
        std::this_thread::sleep_for(WAIT_STEP);
    }
    throw std::runtime_error("Shared memory block '" + segment_name + "' was never initialized");
}

bool SharedPriceTable::load_symbol_index() {
    std::vector<std::string> names;
    names.reserve(entry_count);
    {
        mutex_guard guard(lock, *logger);
        for (size_t i = 0; i < entry_count; ++i) {
            names.emplace_back(entries[i].symbol, strnlen(entries[i].symbol, MAX_SYMBOL_BYTES));
        }
    }

    for (const auto& name : names) {
        if (name.empty()) {
            return false;
        }
    }

    symbol_to_index.clear();
    for (size_t i = 0; i < names.size(); ++i) {
        symbol_to_index.emplace(names[i], i);
    }
    symbol_names = std::move(names);
    return true;
}

bool SharedPriceTable::update(std::string_view symbol, double price) {
    if (!is_open()) {
        logger->warn("Price table '{}' is closed, dropping update {} -> {}", segment_name, symbol, price);
        return false;
    }

    auto it = symbol_to_index.find(std::string(symbol));
    if (it == symbol_to_index.end()) {
        logger->warn("Symbol '{}' not tracked in shared memory", symbol);
        return false;
    }

    mutex_guard guard(lock, *logger);
    entries[it->second].price = price;
    return true;
}

std::optional<double> SharedPriceTable::read(std::string_view symbol) const {
    if (!is_open()) {
        logger->warn("Price table '{}' is closed, cannot read {}", segment_name, symbol);
        return std::nullopt;
    }

    auto it = symbol_to_index.find(std::string(symbol));
    if (it == symbol_to_index.end()) {
        logger->warn("Symbol '{}' not tracked", symbol);
        return std::nullopt;
    }

    mutex_guard guard(lock, *logger);
    return static_cast<double>(entries[it->second].price);
}

std::map<std::string, double> SharedPriceTable::snapshot() const {
    std::map<std::string, double> prices;
    if (!is_open()) {
        logger->warn("Price table '{}' is closed, snapshot is empty", segment_name);
        return prices;
    }

    std::vector<price_entry> copy(entry_count);
    {
        mutex_guard guard(lock, *logger);
        std::memcpy(copy.data(), entries, segment_size(entry_count));
    }

    for (size_t i = 0; i < copy.size(); ++i) {
        prices.emplace(symbol_names[i], static_cast<double>(copy[i].price));
    }
    return prices;
}

void SharedPriceTable::close() {
    bool detached = false;
    if (entries != nullptr) {
        munmap(entries, segment_size(entry_count));
        entries = nullptr;
        detached = true;
    }
    if (lock != nullptr) {
        munmap(lock, sizeof(lock_block));
        lock = nullptr;
        detached = true;
    }

    if (detached) {
        logger->info("Detached from shared memory block '{}'", segment_name);
    }
}

void SharedPriceTable::unlink() {
    if (!creator) {
        logger->warn("Refusing to unlink '{}' from a handle that did not create it", segment_name);
        return;
    }

    if (unlinked) {
        return;
    }
    unlinked = true;

    for (const auto& path : {table_path, lock_path}) {
        if (shm_unlink(path.c_str()) == -1 && errno != ENOENT) {
            logger->error("Failed to unlink shared memory {}: {}", path, strerror(errno));
        }
    }
    logger->info("Shared memory block '{}' destroyed", segment_name);
}

void TableReleaseGuard::release() {
    if (released) {
        return;
    }
    released = true;
    table.unlink();
    table.close();
}

} // namespace tickpipe::store

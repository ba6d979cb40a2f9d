// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "fs-ops.h"

#include <kj/debug.h>
#include <kj/io.h>
#include <kj/mutex.h>
#include <kj/thread.h>
#include <kj/vector.h>

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>

namespace lazyfs {
namespace {

kj::Date toKjDate(struct timespec ts) {
  return ts.tv_sec * kj::SECONDS + ts.tv_nsec * kj::NANOSECONDS + kj::UNIX_EPOCH;
}

Stat statFromOs(const struct stat& stats) {
  FsType type = FsType::OTHER;
  if (S_ISREG(stats.st_mode)) {
    type = FsType::FILE;
  } else if (S_ISDIR(stats.st_mode)) {
    type = FsType::DIRECTORY;
  }
  return Stat{
    .type = type,
    .size = static_cast<uint64_t>(stats.st_size),
    .lastModified = toKjDate(stats.st_mtim),
  };
}

// Writes all of `data` to `fd`, returning the errno of the first failure or 0.
int writeFully(int fd, kj::ArrayPtr<const kj::byte> data) {
  while (data.size() > 0) {
    ssize_t n;
    KJ_SYSCALL_HANDLE_ERRORS(n = ::write(fd, data.begin(), data.size())) {
      default:
        return error;
    }
    data = data.slice(n);
  }
  return 0;
}

class DiskFsOps final: public FsOps {
 public:
  kj::OneOf<FsFailure, Stat> stat(kj::StringPtr path) override {
    struct stat stats;
    KJ_SYSCALL_HANDLE_ERRORS(::stat(path.cStr(), &stats)) {
      default:
        return FsFailure::fromErrno(error, "stat"_kj, path);
    }
    return statFromOs(stats);
  }

  kj::OneOf<FsFailure, kj::Array<kj::String>> listDirectory(kj::StringPtr path) override {
    DIR* dir = opendir(path.cStr());
    if (dir == nullptr) {
      return FsFailure::fromErrno(errno, "opendir"_kj, path);
    }
    KJ_DEFER(closedir(dir));

    kj::Vector<kj::String> names;
    for (;;) {
      errno = 0;
      struct dirent* entry = readdir(dir);
      if (entry == nullptr) {
        int error = errno;
        if (error == 0) break;
        return FsFailure::fromErrno(error, "readdir"_kj, path);
      }

      kj::StringPtr name = entry->d_name;
      if (name != "." && name != "..") {
        names.add(kj::str(name));
      }
    }

    auto result = names.releaseAsArray();
    std::sort(result.begin(), result.end());
    return kj::mv(result);
  }

  kj::OneOf<FsFailure, kj::Array<kj::byte>> readFile(kj::StringPtr path) override {
    int rawFd;
    KJ_SYSCALL_HANDLE_ERRORS(rawFd = ::open(path.cStr(), O_RDONLY | O_CLOEXEC)) {
      default:
        return FsFailure::fromErrno(error, "open"_kj, path);
    }
    kj::AutoCloseFd fd(rawFd);

    struct stat stats;
    KJ_SYSCALL_HANDLE_ERRORS(::fstat(fd, &stats)) {
      default:
        return FsFailure::fromErrno(error, "fstat"_kj, path);
    }
    if (S_ISDIR(stats.st_mode)) {
      return FsFailure::fromErrno(EISDIR, "read"_kj, path);
    }

    // st_size is only a hint; files under /proc report 0 and files can grow while we read.
    kj::Vector<kj::byte> content(kj::max(static_cast<size_t>(stats.st_size), size_t(4096)));
    kj::byte buffer[4096];
    for (;;) {
      ssize_t n;
      KJ_SYSCALL_HANDLE_ERRORS(n = ::read(fd, buffer, sizeof(buffer))) {
        default:
          return FsFailure::fromErrno(error, "read"_kj, path);
      }
      if (n == 0) break;
      content.addAll(kj::arrayPtr(buffer, n));
    }
    return content.releaseAsArray();
  }

  kj::OneOf<FsFailure, size_t> writeFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) override {
    return writeWithFlags(path, data, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, "write"_kj);
  }

  kj::OneOf<FsFailure, size_t> appendFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) override {
    return writeWithFlags(path, data, O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, "append"_kj);
  }

  kj::OneOf<FsFailure, bool> makeDirectory(kj::StringPtr path, Recursive recursive) override {
    if (!recursive) {
      KJ_SYSCALL_HANDLE_ERRORS(::mkdir(path.cStr(), 0777)) {
        default:
          return FsFailure::fromErrno(error, "mkdir"_kj, path);
      }
      return true;
    }

    // Create each prefix in turn, like `mkdir -p`. Prefixes that already exist as
    // directories are fine; anything else in the way is reported.
    bool created = false;
    for (size_t end = 1; end <= path.size(); end++) {
      if (end < path.size() && path[end] != '/') continue;
      auto prefix = kj::str(path.slice(0, end));
      if (prefix == "." || prefix == "/") continue;

      KJ_SYSCALL_HANDLE_ERRORS(::mkdir(prefix.cStr(), 0777)) {
        case EEXIST: {
          struct stat stats;
          if (::stat(prefix.cStr(), &stats) == 0 && S_ISDIR(stats.st_mode)) {
            continue;
          }
          return FsFailure::fromErrno(EEXIST, "mkdir"_kj, prefix);
        }
        default:
          return FsFailure::fromErrno(error, "mkdir"_kj, prefix);
      }
      created = true;
    }
    return created;
  }

  kj::OneOf<FsFailure, kj::String> currentDirectory() override {
    size_t size = 256;
    for (;;) {
      kj::Array<char> buffer = kj::heapArray<char>(size);
      if (::getcwd(buffer.begin(), buffer.size()) != nullptr) {
        return kj::heapString(buffer.begin());
      }
      int error = errno;
      if (error != ERANGE) {
        return FsFailure::fromErrno(error, "getcwd"_kj, "."_kj);
      }
      size *= 2;
    }
  }

 private:
  kj::OneOf<FsFailure, size_t> writeWithFlags(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data, int flags, kj::StringPtr operation) {
    int rawFd;
    KJ_SYSCALL_HANDLE_ERRORS(rawFd = ::open(path.cStr(), flags, 0666)) {
      default:
        return FsFailure::fromErrno(error, operation, path);
    }
    kj::AutoCloseFd fd(rawFd);

    int error = writeFully(fd, data);
    if (error != 0) {
      return FsFailure::fromErrno(error, operation, path);
    }
    return data.size();
  }
};

class AsyncFsOpsAdapter final: public AsyncFsOps {
 public:
  explicit AsyncFsOpsAdapter(FsOps& inner): inner(inner) {}

  kj::Promise<kj::OneOf<FsFailure, Stat>> stat(kj::StringPtr path) override {
    return kj::evalLater(
        [this, path = kj::str(path)]() -> kj::OneOf<FsFailure, Stat> { return inner.stat(path); });
  }

  kj::Promise<kj::OneOf<FsFailure, kj::Array<kj::String>>> listDirectory(
      kj::StringPtr path) override {
    return kj::evalLater([this, path = kj::str(path)]() { return inner.listDirectory(path); });
  }

  kj::Promise<kj::OneOf<FsFailure, kj::Array<kj::byte>>> readFile(kj::StringPtr path) override {
    return kj::evalLater([this, path = kj::str(path)]() { return inner.readFile(path); });
  }

  kj::Promise<kj::OneOf<FsFailure, size_t>> writeFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) override {
    return kj::evalLater([this, path = kj::str(path), data = kj::heapArray(data)]() {
      return inner.writeFile(path, data);
    });
  }

  kj::Promise<kj::OneOf<FsFailure, size_t>> appendFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) override {
    return kj::evalLater([this, path = kj::str(path), data = kj::heapArray(data)]() {
      return inner.appendFile(path, data);
    });
  }

  kj::Promise<kj::OneOf<FsFailure, bool>> makeDirectory(
      kj::StringPtr path, Recursive recursive) override {
    return kj::evalLater([this, path = kj::str(path), recursive]() {
      return inner.makeDirectory(path, recursive);
    });
  }

  kj::OneOf<FsFailure, kj::String> currentDirectory() override {
    return inner.currentDirectory();
  }

 private:
  FsOps& inner;
};

// Runs a blocking table on a thread of its own. Each primitive is handed to that thread's event
// loop through its kj::Executor, so the caller's loop keeps running until the result comes back.
// Primitives run one at a time, in the order they were requested.
class WorkerThreadFsOps final: public AsyncFsOps {
 public:
  explicit WorkerThreadFsOps(kj::Own<FsOps> innerParam)
      : inner(kj::mv(innerParam)),
        thread([this]() { run(); }) {
    auto lock = worker.lockExclusive();
    lock.wait([](const Worker& state) { return state.executor != kj::none; });
    executor = &KJ_ASSERT_NONNULL(lock->executor);
  }

  ~WorkerThreadFsOps() noexcept(false) {
    // `thread` is destroyed next, which joins the worker.
    auto lock = worker.lockExclusive();
    KJ_IF_SOME(stop, lock->stop) {
      stop->fulfill();
    }
  }

  kj::Promise<kj::OneOf<FsFailure, Stat>> stat(kj::StringPtr path) override {
    return executor->executeAsync([this, path = kj::str(path)]() { return inner->stat(path); });
  }

  kj::Promise<kj::OneOf<FsFailure, kj::Array<kj::String>>> listDirectory(
      kj::StringPtr path) override {
    return executor->executeAsync(
        [this, path = kj::str(path)]() { return inner->listDirectory(path); });
  }

  kj::Promise<kj::OneOf<FsFailure, kj::Array<kj::byte>>> readFile(kj::StringPtr path) override {
    return executor->executeAsync(
        [this, path = kj::str(path)]() { return inner->readFile(path); });
  }

  kj::Promise<kj::OneOf<FsFailure, size_t>> writeFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) override {
    return executor->executeAsync([this, path = kj::str(path), data = kj::heapArray(data)]() {
      return inner->writeFile(path, data);
    });
  }

  kj::Promise<kj::OneOf<FsFailure, size_t>> appendFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) override {
    return executor->executeAsync([this, path = kj::str(path), data = kj::heapArray(data)]() {
      return inner->appendFile(path, data);
    });
  }

  kj::Promise<kj::OneOf<FsFailure, bool>> makeDirectory(
      kj::StringPtr path, Recursive recursive) override {
    return executor->executeAsync([this, path = kj::str(path), recursive]() {
      return inner->makeDirectory(path, recursive);
    });
  }

  kj::OneOf<FsFailure, kj::String> currentDirectory() override {
    // `inner` is only ever touched from the worker thread.
    return executor->executeSync([this]() { return inner->currentDirectory(); });
  }

 private:
  struct Worker {
    kj::Maybe<const kj::Executor&> executor;
    kj::Maybe<kj::Own<kj::CrossThreadPromiseFulfiller<void>>> stop;
  };

  kj::Own<FsOps> inner;
  kj::MutexGuarded<Worker> worker;
  const kj::Executor* executor = nullptr;
  kj::Thread thread;

  void run() {
    kj::EventLoop loop;
    kj::WaitScope waitScope(loop);
    auto paf = kj::newPromiseAndCrossThreadFulfiller<void>();
    {
      auto lock = worker.lockExclusive();
      lock->executor = kj::getCurrentThreadExecutor();
      lock->stop = kj::mv(paf.fulfiller);
    }
    paf.promise.wait(waitScope);
  }
};

}  // namespace

kj::Own<FsOps> newDiskFsOps() {
  return kj::heap<DiskFsOps>();
}

kj::Own<AsyncFsOps> newAsyncFsOps(FsOps& inner) {
  return kj::heap<AsyncFsOpsAdapter>(inner);
}

kj::Own<AsyncFsOps> newWorkerThreadFsOps(kj::Own<FsOps> inner) {
  return kj::heap<WorkerThreadFsOps>(kj::mv(inner));
}

kj::Own<AsyncFsOps> newDiskAsyncFsOps() {
  return newWorkerThreadFsOps(newDiskFsOps());
}

}  // namespace lazyfs

// Copyright 2023 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "CrossDomainBackend.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "TransferUtils.h"
#include "VirtioGpuFormats.h"
#include "aemu/base/threads/WorkerThread.h"
#include "host-common/BrokerFatalError.h"
#include "host-common/logging.h"

namespace gfxbroker {

using android::base::AutoLock;
using android::base::ManagedDescriptor;
using android::base::SharedMemory;
using android::base::WorkerProcessingResult;

namespace {

constexpr uint32_t kLinearStrideAlignment = 64;
constexpr uint64_t kBlobSizeAlignment = 4096;
constexpr uint64_t kDrmFormatModLinear = 0;

template <typename T>
bool readCommand(const uint8_t* data, size_t available, T* out) {
    if (available < sizeof(T)) {
        return false;
    }
    memcpy(out, data, sizeof(T));
    return true;
}

// The opaque bytes of a SEND or WRITE must fit inside the command.
template <typename T>
bool readPayload(const uint8_t* data, size_t cmdSize, const T& cmd, const uint8_t** outPayload) {
    if (cmd.opaque_data_size > cmdSize - sizeof(T)) {
        return false;
    }
    *outPayload = data + sizeof(T);
    return true;
}

// A reader that went away shows up as EPIPE instead of SIGPIPE.
bool writeAll(int fd, const uint8_t* data, size_t size) {
    sigset_t pipeSignal;
    sigset_t previousMask;
    sigset_t pending;
    sigemptyset(&pipeSignal);
    sigaddset(&pipeSignal, SIGPIPE);
    sigemptyset(&pending);
    pthread_sigmask(SIG_BLOCK, &pipeSignal, &previousMask);
    sigpending(&pending);
    const bool alreadyPending = sigismember(&pending, SIGPIPE) == 1;

    bool ok = true;
    while (size > 0) {
        ssize_t written = write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            ok = false;
            break;
        }
        data += written;
        size -= static_cast<size_t>(written);
    }

    if (!ok && errno == EPIPE && !alreadyPending) {
        const int savedErrno = errno;
        struct timespec noWait = {0, 0};
        sigtimedwait(&pipeSignal, nullptr, &noWait);
        errno = savedErrno;
    }
    pthread_sigmask(SIG_SETMASK, &previousMask, nullptr);
    return ok;
}

bool sendMessage(int fd, const uint8_t* data, size_t size, const std::vector<int>& fds) {
    alignas(cmsghdr) char control[CMSG_SPACE(sizeof(int) * kCrossDomainMaxIdentifiers)];
    iovec iov{const_cast<uint8_t*>(data), size};
    msghdr msg;
    memset(&msg, 0, sizeof(msg));
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    if (!fds.empty()) {
        memset(control, 0, sizeof(control));
        msg.msg_control = control;
        msg.msg_controllen = CMSG_SPACE(sizeof(int) * fds.size());
        cmsghdr* cmsg = CMSG_FIRSTHDR(&msg);
        cmsg->cmsg_level = SOL_SOCKET;
        cmsg->cmsg_type = SCM_RIGHTS;
        cmsg->cmsg_len = CMSG_LEN(sizeof(int) * fds.size());
        memcpy(CMSG_DATA(cmsg), fds.data(), sizeof(int) * fds.size());
    }
    ssize_t sent;
    do {
        sent = sendmsg(fd, &msg, MSG_NOSIGNAL);
    } while (sent < 0 && errno == EINTR);
    return sent == static_cast<ssize_t>(size);
}

BrokerResult receiveMessage(int fd, uint8_t* buffer, size_t capacity, size_t* outSize,
                            std::vector<ManagedDescriptor>* outDescriptors) {
    alignas(cmsghdr) char control[CMSG_SPACE(sizeof(int) * kCrossDomainMaxIdentifiers)];
    iovec iov{buffer, capacity};
    msghdr msg;
    memset(&msg, 0, sizeof(msg));
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    msg.msg_control = control;
    msg.msg_controllen = sizeof(control);

    ssize_t received;
    do {
        received = recvmsg(fd, &msg, MSG_CMSG_CLOEXEC);
    } while (received < 0 && errno == EINTR);
    if (received < 0) {
        ERR("Failed to receive from the cross-domain channel: %s", strerror(errno));
        return BrokerResult::kBackendFailure;
    }

    for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg); cmsg; cmsg = CMSG_NXTHDR(&msg, cmsg)) {
        if (cmsg->cmsg_level != SOL_SOCKET || cmsg->cmsg_type != SCM_RIGHTS) {
            continue;
        }
        const size_t count = (cmsg->cmsg_len - CMSG_LEN(0)) / sizeof(int);
        for (size_t i = 0; i < count; ++i) {
            int descriptor;
            memcpy(&descriptor, CMSG_DATA(cmsg) + i * sizeof(int), sizeof(int));
            outDescriptors->emplace_back(descriptor);
        }
    }
    if (msg.msg_flags & MSG_CTRUNC) {
        ERR("The cross-domain channel sent more than %u descriptors.", kCrossDomainMaxIdentifiers);
        return BrokerResult::kOutOfRange;
    }
    *outSize = static_cast<size_t>(received);
    return BrokerResult::kOk;
}

class CrossDomainContext : public BackendContext {
   public:
    CrossDomainContext(CrossDomainBackend* backend, BackendHost* host, ContextId ctxId)
        : mBackend(backend),
          mHost(host),
          mCtxId(ctxId),
          mChannelWorker([this](ChannelJob&& job) { return runChannelJob(std::move(job)); }) {}

    ~CrossDomainContext() override {
        if (mChannelWorkerStarted) {
            // Fences still queued complete without waiting for the channel.
            mExiting = true;
            wakeChannelWorker();
            mChannelWorker.enqueue(ChannelJob(Exit{}));
            mChannelWorker.join();
        }
    }

    ComponentType componentType() const override { return ComponentType::kCrossDomain; }

    BrokerResult submit(const CommandBuffer& commands, const Fence& fence,
                        base::AsyncResult* outResult) override {
        const auto* ring = std::get_if<FenceRingContextSpecific>(&fence.ring);
        if (!ring || ring->ctxId != mCtxId || ring->ringIdx > kCrossDomainChannelRing) {
            ERR("Cross-domain context %u cannot fence on %s.", mCtxId,
                to_string(fence.ring).c_str());
            return BrokerResult::kInvalidArgument;
        }

        BrokerResult result = processCommands(commands);
        if (result != BrokerResult::kOk) {
            return result;
        }

        bool channelOpen;
        {
            AutoLock lock(mLock);
            channelOpen = mChannelWorkerStarted;
        }
        if (ring->ringIdx == kCrossDomainChannelRing && channelOpen) {
            mChannelWorker.enqueue(ChannelJob(FenceJob{.ring = fence.ring, .id = fence.id}));
            *outResult = base::AsyncResult::OK_AND_CALLBACK_SCHEDULED;
        } else {
            // Query ring replies are written before submit returns.
            *outResult = base::AsyncResult::OK_AND_CALLBACK_NOT_SCHEDULED;
        }
        return BrokerResult::kOk;
    }

    BrokerResult createBlob(ResourceId id, const BlobCreateArgs& args,
                            BackendResource* outResource) override {
        std::optional<CrossDomainImageRequirements> reqs;
        std::optional<BlobItem> received;
        {
            AutoLock lock(mLock);
            auto it = mItems.find(static_cast<uint32_t>(args.blobId));
            if (args.blobId > UINT32_MAX || it == mItems.end()) {
                ERR("Cross-domain context %u has no item %llu.", mCtxId,
                    static_cast<unsigned long long>(args.blobId));
                return BrokerResult::kInvalidArgument;
            }
            if (const auto* image = std::get_if<CrossDomainImageRequirements>(&it->second)) {
                reqs = *image;
            } else if (auto* blob = std::get_if<BlobItem>(&it->second)) {
                if (args.size > blob->size) {
                    ERR("Blob size %llu exceeds the received descriptor (%llu bytes).",
                        static_cast<unsigned long long>(args.size),
                        static_cast<unsigned long long>(blob->size));
                    return BrokerResult::kInvalidArgument;
                }
                received = std::move(*blob);
                mItems.erase(it);
            } else {
                ERR("Item %llu of context %u cannot back a blob.",
                    static_cast<unsigned long long>(args.blobId), mCtxId);
                return BrokerResult::kInvalidArgument;
            }
        }
        if (received) {
            return mBackend->adoptDescriptor(id, args.size, std::move(received->descriptor),
                                             outResource);
        }
        if (reqs->size != args.size) {
            ERR("Blob size %llu does not match item size %llu.",
                static_cast<unsigned long long>(args.size),
                static_cast<unsigned long long>(reqs->size));
            return BrokerResult::kInvalidArgument;
        }
        return mBackend->allocateSharedMemory(id, reqs->size, outResource);
    }

    BrokerResult attachResource(const ContextResource& resource) override {
        AutoLock lock(mLock);
        mContextResources[resource.id] = resource;
        return BrokerResult::kOk;
    }

    void detachResource(ResourceId id) override {
        AutoLock lock(mLock);
        mContextResources.erase(id);
    }

   private:
    struct FenceJob {
        FenceRing ring;
        FenceId id;
    };
    struct Exit {};
    using ChannelJob = std::variant<FenceJob, Exit>;

    struct RingState {
        uint32_t queryRingId = 0;
        uint32_t channelRingId = 0;
        uint32_t channelType = 0;
    };

    struct BlobItem {
        ManagedDescriptor descriptor;
        uint64_t size = 0;
    };
    struct ReadPipeItem {
        ManagedDescriptor descriptor;
    };
    struct WritePipeItem {
        ManagedDescriptor descriptor;
    };
    using Item = std::variant<CrossDomainImageRequirements, BlobItem, ReadPipeItem, WritePipeItem>;

    WorkerProcessingResult runChannelJob(ChannelJob&& job) {
        if (std::holds_alternative<Exit>(job)) {
            return WorkerProcessingResult::Stop;
        }
        const FenceJob& fenceJob = std::get<FenceJob>(job);
        BrokerResult result = waitForChannelEvent();
        if (result != BrokerResult::kOk) {
            ERR("Closing the cross-domain channel of context %u: %s", mCtxId, toString(result));
            AutoLock lock(mLock);
            mChannelClosed = true;
        }
        result = mHost->signalFence(fenceJob.ring, fenceJob.id);
        if (result != BrokerResult::kOk) {
            ERR("Channel fence %llu rejected: %s", static_cast<unsigned long long>(fenceJob.id),
                toString(result));
        }
        return WorkerProcessingResult::Continue;
    }

    // Blocks until the channel or a read pipe has something for the guest and writes it to the
    // channel ring. One event per fence keeps the guest's view of the ring ordered.
    BrokerResult waitForChannelEvent() {
        for (;;) {
            if (mExiting) {
                return BrokerResult::kOk;
            }
            std::vector<pollfd> fds = {pollfd{*mWakeRead.get(), POLLIN, 0}};
            std::vector<uint32_t> itemIds = {0};
            {
                AutoLock lock(mLock);
                if (mChannelClosed) {
                    return BrokerResult::kOk;
                }
                fds.push_back(pollfd{*mChannel.get(), POLLIN, 0});
                itemIds.push_back(0);
                for (const auto& entry : mItems) {
                    if (const auto* pipe = std::get_if<ReadPipeItem>(&entry.second)) {
                        fds.push_back(pollfd{*pipe->descriptor.get(), POLLIN, 0});
                        itemIds.push_back(entry.first);
                    }
                }
            }

            int ready;
            do {
                ready = poll(fds.data(), fds.size(), -1);
            } while (ready < 0 && errno == EINTR);
            if (ready < 0) {
                ERR("Polling the cross-domain channel failed: %s", strerror(errno));
                return BrokerResult::kBackendFailure;
            }

            if (fds[0].revents) {
                drainWakePipe();
                continue;
            }
            if (fds[1].revents) {
                return receiveFromChannel();
            }
            for (size_t i = 2; i < fds.size(); ++i) {
                if (fds[i].revents) {
                    return readFromPipe(itemIds[i], fds[i].fd, fds[i].revents);
                }
            }
        }
    }

    BrokerResult receiveFromChannel() {
        size_t size = 0;
        std::vector<ManagedDescriptor> descriptors;
        BrokerResult result = receiveMessage(*mChannel.get(), mBuffer,
                                             kCrossDomainMaxSendReceiveSize, &size, &descriptors);
        if (result != BrokerResult::kOk) {
            return result;
        }

        AutoLock lock(mLock);
        if (size == 0 && descriptors.empty()) {
            INFO("Cross-domain channel of context %u hung up.", mCtxId);
            mChannelClosed = true;
            return BrokerResult::kOk;
        }

        CrossDomainSendReceive reply;
        memset(&reply, 0, sizeof(reply));
        reply.hdr.cmd = kCrossDomainCmdReceive;
        reply.hdr.cmd_size = static_cast<uint16_t>(sizeof(reply) + size);
        reply.num_identifiers = static_cast<uint32_t>(descriptors.size());
        reply.opaque_data_size = static_cast<uint32_t>(size);
        for (size_t i = 0; i < descriptors.size(); ++i) {
            result = addReceivedItemLocked(std::move(descriptors[i]), &reply.identifiers[i],
                                           &reply.identifier_types[i], &reply.identifier_sizes[i]);
            if (result != BrokerResult::kOk) {
                return result;
            }
        }
        return writeToRingLocked(mState->channelRingId, &reply, sizeof(reply), mBuffer, size);
    }

    // Memory goes to the guest as a blob it can create by item id. Write pipes are kept for
    // WRITE commands.
    BrokerResult addReceivedItemLocked(ManagedDescriptor descriptor, uint32_t* outId,
                                       uint32_t* outType, uint32_t* outSize) {
        const int fd = *descriptor.get();
        struct stat st;
        if (fstat(fd, &st) != 0) {
            ERR("Cannot inspect a received descriptor: %s", strerror(errno));
            return BrokerResult::kBackendFailure;
        }
        if (S_ISFIFO(st.st_mode)) {
            const int flags = fcntl(fd, F_GETFL);
            if (flags < 0 || (flags & O_ACCMODE) != O_WRONLY) {
                ERR("Only the write end of a pipe can be received.");
                return BrokerResult::kUnsupported;
            }
            *outId = mNextItemId++;
            *outType = kCrossDomainIdTypeWritePipe;
            *outSize = 0;
            mItems[*outId] = WritePipeItem{std::move(descriptor)};
            return BrokerResult::kOk;
        }
        const off_t size = lseek(fd, 0, SEEK_END);
        if (size < 0 || static_cast<uint64_t>(size) > UINT32_MAX) {
            ERR("Received descriptor is not a shareable memory object.");
            return BrokerResult::kUnsupported;
        }
        *outId = mNextItemId++;
        *outType = kCrossDomainIdTypeVirtgpuBlob;
        *outSize = static_cast<uint32_t>(size);
        mItems[*outId] = BlobItem{std::move(descriptor), static_cast<uint64_t>(size)};
        return BrokerResult::kOk;
    }

    BrokerResult readFromPipe(uint32_t pipeId, int fd, short revents) {
        ssize_t size = 0;
        if (revents & POLLIN) {
            do {
                size = read(fd, mBuffer, kCrossDomainMaxReadWriteSize);
            } while (size < 0 && errno == EINTR);
            if (size < 0) {
                ERR("Reading pipe %u failed: %s", pipeId, strerror(errno));
                return BrokerResult::kBackendFailure;
            }
        }
        // Zero bytes means the writer is gone.
        const bool hungUp = size == 0;

        CrossDomainReadWrite reply;
        memset(&reply, 0, sizeof(reply));
        reply.hdr.cmd = kCrossDomainCmdRead;
        reply.hdr.cmd_size = static_cast<uint16_t>(sizeof(reply) + size);
        reply.identifier = pipeId;
        reply.hang_up = hungUp ? 1 : 0;
        reply.opaque_data_size = static_cast<uint32_t>(size);

        AutoLock lock(mLock);
        if (hungUp) {
            mItems.erase(pipeId);
        }
        return writeToRingLocked(mState->channelRingId, &reply, sizeof(reply), mBuffer,
                                 static_cast<size_t>(size));
    }

    void wakeChannelWorker() {
        const uint8_t byte = 1;
        ssize_t written;
        do {
            written = write(*mWakeWrite.get(), &byte, sizeof(byte));
        } while (written < 0 && errno == EINTR);
        // A full pipe already has a wakeup pending.
        if (written < 0 && errno != EAGAIN) {
            ERR("Failed to wake the cross-domain channel worker: %s", strerror(errno));
        }
    }

    void drainWakePipe() {
        uint8_t bytes[64];
        while (read(*mWakeRead.get(), bytes, sizeof(bytes)) > 0) {
        }
    }

    BrokerResult startChannelWorkerLocked(ManagedDescriptor channel) {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
            ERR("Failed to create the cross-domain wake pipe: %s", strerror(errno));
            return BrokerResult::kBackendFailure;
        }
        mWakeRead = ManagedDescriptor(fds[0]);
        mWakeWrite = ManagedDescriptor(fds[1]);
        mChannel = std::move(channel);
        if (!mChannelWorker.start()) {
            GFXBROKER_ABORT(FatalError(ABORT_REASON_OTHER))
                << "failed to start the cross-domain channel worker";
        }
        mChannelWorkerStarted = true;
        return BrokerResult::kOk;
    }

    BrokerResult processCommands(const CommandBuffer& commands) {
        const uint8_t* data = commands.data;
        size_t remaining = commands.size;
        while (remaining > 0) {
            CrossDomainHeader hdr;
            if (!readCommand(data, remaining, &hdr) || hdr.cmd_size < sizeof(hdr) ||
                hdr.cmd_size > remaining) {
                ERR("Malformed cross-domain command header (%zu bytes left).", remaining);
                return BrokerResult::kInvalidArgument;
            }

            BrokerResult result = BrokerResult::kOk;
            switch (hdr.cmd) {
                case kCrossDomainCmdInit:
                    result = handleInit(data, hdr.cmd_size);
                    break;
                case kCrossDomainCmdGetImageRequirements:
                    result = handleGetImageRequirements(data, hdr.cmd_size);
                    break;
                case kCrossDomainCmdPoll:
                    // Fence creation does the polling.
                    break;
                case kCrossDomainCmdSend:
                    result = handleSend(data, hdr.cmd_size);
                    break;
                case kCrossDomainCmdWrite:
                    result = handleWrite(data, hdr.cmd_size);
                    break;
                default:
                    ERR("Unsupported cross-domain command %u.", hdr.cmd);
                    result = BrokerResult::kUnsupported;
                    break;
            }
            if (result != BrokerResult::kOk) {
                return result;
            }
            data += hdr.cmd_size;
            remaining -= hdr.cmd_size;
        }
        return BrokerResult::kOk;
    }

    BrokerResult handleInit(const uint8_t* data, size_t size) {
        RingState state;
        CrossDomainInit init;
        CrossDomainInitLegacy legacy;
        if (readCommand(data, size, &init)) {
            state.queryRingId = init.query_ring_id;
            state.channelRingId = init.channel_ring_id;
            state.channelType = init.channel_type;
        } else if (readCommand(data, size, &legacy)) {
            state.queryRingId = legacy.query_ring_id;
            state.channelRingId = legacy.query_ring_id;
            state.channelType = legacy.channel_type;
        } else {
            return BrokerResult::kInvalidArgument;
        }

        {
            AutoLock lock(mLock);
            if (mState) {
                ERR("Cross-domain context %u is already initialized.", mCtxId);
                return BrokerResult::kInvalidArgument;
            }
            if (!mContextResources.count(state.queryRingId) ||
                (state.channelType != 0 && !mContextResources.count(state.channelRingId))) {
                ERR("Cross-domain rings %u/%u are not attached to context %u.",
                    state.queryRingId, state.channelRingId, mCtxId);
                return BrokerResult::kInvalidArgument;
            }
        }

        // A channel type of zero only uses the query ring.
        ManagedDescriptor channel;
        if (state.channelType != 0) {
            BrokerResult result = mBackend->connectChannel(state.channelType, &channel);
            if (result != BrokerResult::kOk) {
                return result;
            }
        }

        AutoLock lock(mLock);
        if (mState) {
            ERR("Cross-domain context %u is already initialized.", mCtxId);
            return BrokerResult::kInvalidArgument;
        }
        mState = state;
        if (state.channelType != 0) {
            BrokerResult result = startChannelWorkerLocked(std::move(channel));
            if (result != BrokerResult::kOk) {
                mState.reset();
                return result;
            }
        }
        return BrokerResult::kOk;
    }

    BrokerResult handleGetImageRequirements(const uint8_t* data, size_t size) {
        CrossDomainGetImageRequirements cmd;
        if (!readCommand(data, size, &cmd)) {
            return BrokerResult::kInvalidArgument;
        }
        CrossDomainImageRequirements reqs;
        BrokerResult result =
            computeLinearImageRequirements(cmd.width, cmd.height, cmd.drm_format, &reqs);
        if (result != BrokerResult::kOk) {
            return result;
        }

        AutoLock lock(mLock);
        if (!mState) {
            ERR("Image requirements requested before INIT on context %u.", mCtxId);
            return BrokerResult::kInvalidArgument;
        }
        reqs.blob_id = mNextItemId++;
        mItems[reqs.blob_id] = reqs;
        return writeToRingLocked(mState->queryRingId, &reqs, sizeof(reqs), nullptr, 0);
    }

    BrokerResult handleSend(const uint8_t* data, size_t size) {
        CrossDomainSendReceive cmd;
        const uint8_t* payload = nullptr;
        if (!readCommand(data, size, &cmd) || !readPayload(data, size, cmd, &payload)) {
            ERR("Malformed cross-domain SEND on context %u.", mCtxId);
            return BrokerResult::kInvalidArgument;
        }
        if (cmd.num_identifiers > kCrossDomainMaxIdentifiers) {
            ERR("SEND carries %u identifiers, at most %u are allowed.", cmd.num_identifiers,
                kCrossDomainMaxIdentifiers);
            return BrokerResult::kInvalidArgument;
        }
        {
            AutoLock lock(mLock);
            if (!mChannelWorkerStarted || mChannelClosed) {
                ERR("Cross-domain context %u has no open channel.", mCtxId);
                return BrokerResult::kInvalidArgument;
            }
        }

        // Our copy of a read pipe's write end closes once the message is out, so the read end
        // sees the hang-up when the peer closes its copy.
        std::vector<ManagedDescriptor> descriptors;
        std::optional<ReadPipeItem> readPipe;
        uint32_t readPipeId = 0;
        for (uint32_t i = 0; i < cmd.num_identifiers; ++i) {
            const uint32_t identifier = cmd.identifiers[i];
            switch (cmd.identifier_types[i]) {
                case kCrossDomainIdTypeVirtgpuBlob: {
                    {
                        AutoLock lock(mLock);
                        if (!mContextResources.count(identifier)) {
                            ERR("Resource %u is not attached to context %u.", identifier,
                                mCtxId);
                            return BrokerResult::kInvalidArgument;
                        }
                    }
                    ManagedDescriptor descriptor;
                    uint32_t handleType = 0;
                    BrokerResult result =
                        mHost->duplicateResourceHandle(identifier, &descriptor, &handleType);
                    if (result != BrokerResult::kOk) {
                        ERR("Resource %u cannot be sent over the channel: %s", identifier,
                            toString(result));
                        return result;
                    }
                    descriptors.push_back(std::move(descriptor));
                    break;
                }
                case kCrossDomainIdTypeReadPipe: {
                    if (readPipe) {
                        ERR("SEND may create only one pipe.");
                        return BrokerResult::kInvalidArgument;
                    }
                    {
                        // The guest predicts the id of the read end.
                        AutoLock lock(mLock);
                        if (identifier != mNextReadPipeId) {
                            ERR("Guest expected read pipe %u, the next one is %u.", identifier,
                                mNextReadPipeId);
                            return BrokerResult::kInvalidArgument;
                        }
                        ++mNextReadPipeId;
                    }
                    int fds[2];
                    if (pipe2(fds, O_CLOEXEC) != 0) {
                        ERR("Failed to create a pipe: %s", strerror(errno));
                        return BrokerResult::kBackendFailure;
                    }
                    readPipe = ReadPipeItem{ManagedDescriptor(fds[0])};
                    readPipeId = identifier;
                    descriptors.emplace_back(fds[1]);
                    break;
                }
                default:
                    ERR("Cannot send identifier type %u.", cmd.identifier_types[i]);
                    return BrokerResult::kInvalidArgument;
            }
        }

        std::vector<int> fds;
        for (const ManagedDescriptor& descriptor : descriptors) {
            fds.push_back(*descriptor.get());
        }
        if (!sendMessage(*mChannel.get(), payload, cmd.opaque_data_size, fds)) {
            ERR("Failed to send %u bytes over the cross-domain channel: %s",
                cmd.opaque_data_size, strerror(errno));
            return BrokerResult::kBackendFailure;
        }

        if (readPipe) {
            {
                AutoLock lock(mLock);
                mItems[readPipeId] = std::move(*readPipe);
            }
            wakeChannelWorker();
        }
        return BrokerResult::kOk;
    }

    BrokerResult handleWrite(const uint8_t* data, size_t size) {
        CrossDomainReadWrite cmd;
        const uint8_t* payload = nullptr;
        if (!readCommand(data, size, &cmd) || !readPayload(data, size, cmd, &payload)) {
            ERR("Malformed cross-domain WRITE on context %u.", mCtxId);
            return BrokerResult::kInvalidArgument;
        }

        AutoLock lock(mLock);
        auto it = mItems.find(cmd.identifier);
        auto* pipe = it == mItems.end() ? nullptr : std::get_if<WritePipeItem>(&it->second);
        if (!pipe) {
            ERR("Item %u of context %u is not a write pipe.", cmd.identifier, mCtxId);
            return BrokerResult::kInvalidArgument;
        }
        if (!writeAll(*pipe->descriptor.get(), payload, cmd.opaque_data_size)) {
            ERR("Writing to pipe %u failed: %s", cmd.identifier, strerror(errno));
            mItems.erase(it);
            return BrokerResult::kBackendFailure;
        }
        if (cmd.hang_up) {
            mItems.erase(it);
        }
        return BrokerResult::kOk;
    }

    // Replies start at the beginning of the ring. Payload bytes follow the command.
    BrokerResult writeToRingLocked(uint32_t ringId, const void* cmd, size_t cmdSize,
                                   const void* payload, size_t payloadSize) {
        auto it = mContextResources.find(ringId);
        if (it == mContextResources.end()) {
            ERR("Ring %u is no longer attached to context %u.", ringId, mCtxId);
            return BrokerResult::kInvalidArgument;
        }
        const ContextResource& ring = it->second;
        const size_t available =
            ring.mapping.hva ? ring.mapping.size : iovecsTotalSize(ring.iovecs);
        if (available < cmdSize + payloadSize) {
            ERR("Ring %u is too small for a %zu byte reply.", ringId, cmdSize + payloadSize);
            return BrokerResult::kInvalidArgument;
        }
        if (ring.mapping.hva) {
            uint8_t* hva = static_cast<uint8_t*>(ring.mapping.hva);
            memcpy(hva, cmd, cmdSize);
            if (payloadSize) {
                memcpy(hva + cmdSize, payload, payloadSize);
            }
            return BrokerResult::kOk;
        }
        if (!copyToIovecs(ring.iovecs, 0, cmd, cmdSize) ||
            (payloadSize && !copyToIovecs(ring.iovecs, cmdSize, payload, payloadSize))) {
            return BrokerResult::kInvalidArgument;
        }
        return BrokerResult::kOk;
    }

    CrossDomainBackend* const mBackend;
    BackendHost* const mHost;
    const ContextId mCtxId;

    android::base::Lock mLock;
    std::optional<RingState> mState;
    std::map<ResourceId, ContextResource> mContextResources;
    std::map<uint32_t, Item> mItems;
    uint32_t mNextItemId = 1;
    uint32_t mNextReadPipeId = kCrossDomainPipeReadStart + 1;

    // Set before the worker starts and closed after it is joined.
    ManagedDescriptor mChannel;
    ManagedDescriptor mWakeRead;
    ManagedDescriptor mWakeWrite;
    bool mChannelClosed = false;
    std::atomic<bool> mExiting{false};
    // Only touched by the channel worker.
    uint8_t mBuffer[kCrossDomainDefaultBufferSize];

    android::base::WorkerThread<ChannelJob> mChannelWorker;
    bool mChannelWorkerStarted = false;
};

}  // namespace

BrokerResult computeLinearImageRequirements(uint32_t width, uint32_t height, uint32_t drmFormat,
                                            CrossDomainImageRequirements* outReqs) {
    if (width == 0 || height == 0 || width > 16384 || height > 16384) {
        return BrokerResult::kInvalidArgument;
    }
    CrossDomainImageRequirements reqs;
    memset(&reqs, 0, sizeof(reqs));
    reqs.modifier = kDrmFormatModLinear;
    reqs.map_info = kMapCacheCached;
    reqs.memory_idx = -1;
    reqs.physical_device_idx = -1;

    uint64_t size = 0;
    if (drmFormat == kDrmFormatNv12) {
        const uint32_t stride = align_up(width, kLinearStrideAlignment);
        reqs.strides[0] = stride;
        reqs.strides[1] = stride;
        reqs.offsets[1] = stride * height;
        size = static_cast<uint64_t>(stride) * height +
               static_cast<uint64_t>(stride) * ((height + 1) / 2);
    } else {
        auto bpp = drm_format_bpp(drmFormat);
        if (!bpp) {
            ERR("Unsupported DRM format 0x%x for cross-domain images.", drmFormat);
            return BrokerResult::kUnsupported;
        }
        const uint32_t stride = align_up(width * *bpp, kLinearStrideAlignment);
        reqs.strides[0] = stride;
        size = static_cast<uint64_t>(stride) * height;
    }
    reqs.size = align_up_64(size, kBlobSizeAlignment);
    *outReqs = reqs;
    return BrokerResult::kOk;
}

CrossDomainConnector unixSocketConnector(std::map<uint32_t, std::string> socketPaths) {
    return [socketPaths = std::move(socketPaths)](uint32_t channelType,
                                                  ManagedDescriptor* outChannel) {
        auto it = socketPaths.find(channelType);
        if (it == socketPaths.end()) {
            ERR("No socket is registered for cross-domain channel type %u.", channelType);
            return BrokerResult::kUnsupported;
        }
        sockaddr_un addr;
        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        if (it->second.size() >= sizeof(addr.sun_path)) {
            ERR("Socket path %s is too long.", it->second.c_str());
            return BrokerResult::kInvalidArgument;
        }
        memcpy(addr.sun_path, it->second.c_str(), it->second.size());

        int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            ERR("Failed to create a unix socket: %s", strerror(errno));
            return BrokerResult::kBackendFailure;
        }
        ManagedDescriptor channel(fd);
        int ret;
        do {
            ret = connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
        } while (ret < 0 && errno == EINTR);
        if (ret != 0) {
            ERR("Failed to connect to %s: %s", it->second.c_str(), strerror(errno));
            return BrokerResult::kBackendFailure;
        }
        *outChannel = std::move(channel);
        return BrokerResult::kOk;
    };
}

CrossDomainBackend::CrossDomainBackend(uint32_t supportedChannels, CrossDomainConnector connector)
    : mSupportedChannels(supportedChannels), mConnector(std::move(connector)) {}

CrossDomainBackend::~CrossDomainBackend() = default;

std::vector<CapsetDescriptor> CrossDomainBackend::capsets() const {
    CrossDomainCapabilities caps{.version = kCrossDomainCapsetVersion,
                                 .supported_channels = mSupportedChannels,
                                 .supports_dmabuf = 0,
                                 .supports_external_gpu_memory = 0};
    CapsetDescriptor capset{.id = kCapsetCrossDomain, .version = kCrossDomainCapsetVersion};
    capset.data.resize(sizeof(caps));
    memcpy(capset.data.data(), &caps, sizeof(caps));
    return {capset};
}

BrokerResult CrossDomainBackend::initialize(BackendHost* host) {
    mHost = host;
    return BrokerResult::kOk;
}

BrokerResult CrossDomainBackend::createContext(ContextId ctxId, uint32_t capsetId,
                                               const std::string& name,
                                               std::unique_ptr<BackendContext>* outContext) {
    if (capsetId != kCapsetCrossDomain) {
        return BrokerResult::kUnsupported;
    }
    BROKER_DEBUG_LOG("cross-domain context %u (%s)", ctxId, name.c_str());
    *outContext = std::make_unique<CrossDomainContext>(this, mHost, ctxId);
    return BrokerResult::kOk;
}

BrokerResult CrossDomainBackend::createResource(ResourceId, const ResourceCreateArgs&,
                                                BackendResource*) {
    ERR("The cross-domain component only creates blobs.");
    return BrokerResult::kUnsupported;
}

BrokerResult CrossDomainBackend::createBlob(ResourceId id, const BlobCreateArgs& args,
                                            const IovecList& iovecs,
                                            BackendResource* outResource) {
    if (args.blobMem != kBlobMemGuest && args.blobFlags != kBlobFlagUseMappable) {
        ERR("The cross-domain component expects guest memory blobs.");
        return BrokerResult::kUnsupported;
    }
    if (args.blobMem == kBlobMemGuest && iovecsTotalSize(iovecs) < args.size) {
        return BrokerResult::kInvalidArgument;
    }
    AutoLock lock(mLock);
    mResources[id] = Resource{.size = args.size};
    outResource->size = args.size;
    outResource->mapInfo = 0;
    outResource->mapping = ResourceMapping{};
    return BrokerResult::kOk;
}

BrokerResult CrossDomainBackend::connectChannel(uint32_t channelType,
                                                ManagedDescriptor* outChannel) {
    if (channelType >= 32 || !(mSupportedChannels & (1u << channelType))) {
        ERR("Cross-domain channel type %u is not supported.", channelType);
        return BrokerResult::kUnsupported;
    }
    if (!mConnector) {
        ERR("No connector is configured for cross-domain channel type %u.", channelType);
        return BrokerResult::kUnsupported;
    }
    BrokerResult result = mConnector(channelType, outChannel);
    if (result == BrokerResult::kOk && !outChannel->get()) {
        return BrokerResult::kBackendFailure;
    }
    return result;
}

BrokerResult CrossDomainBackend::allocateSharedMemory(ResourceId id, uint64_t size,
                                                      BackendResource* outResource) {
    auto sharedMemory =
        std::make_unique<SharedMemory>("shared-memory-" + std::to_string(id), size);
    int ret = sharedMemory->create(0600);
    if (ret) {
        ERR("Failed to create a %llu byte shared memory blob: %d",
            static_cast<unsigned long long>(size), ret);
        return BrokerResult::kBackendFailure;
    }
    outResource->size = size;
    outResource->mapInfo = kMapCacheCached | kMapAccessRw;
    outResource->mapping = ResourceMapping{.hva = sharedMemory->get(), .size = size};

    AutoLock lock(mLock);
    mResources[id] = Resource{.size = size, .sharedMemory = std::move(sharedMemory)};
    return BrokerResult::kOk;
}

BrokerResult CrossDomainBackend::adoptDescriptor(ResourceId id, uint64_t size,
                                                 ManagedDescriptor descriptor,
                                                 BackendResource* outResource) {
    outResource->size = size;
    outResource->mapInfo = 0;
    outResource->mapping = ResourceMapping{};

    AutoLock lock(mLock);
    mResources[id] = Resource{.size = size, .descriptor = std::move(descriptor)};
    return BrokerResult::kOk;
}

BrokerResult CrossDomainBackend::attachBacking(ResourceId id, const IovecList&) {
    AutoLock lock(mLock);
    return mResources.count(id) ? BrokerResult::kOk : BrokerResult::kNotFound;
}

void CrossDomainBackend::detachBacking(ResourceId) {}

BrokerResult CrossDomainBackend::transferToHost(ContextId, ResourceId id, const TransferBox&) {
    // Blobs share their pages with the guest, so there is nothing to copy.
    AutoLock lock(mLock);
    return mResources.count(id) ? BrokerResult::kOk : BrokerResult::kNotFound;
}

BrokerResult CrossDomainBackend::transferFromHost(ContextId, ResourceId id, const TransferBox&,
                                                  const IovecList*) {
    AutoLock lock(mLock);
    return mResources.count(id) ? BrokerResult::kOk : BrokerResult::kNotFound;
}

BrokerResult CrossDomainBackend::exportResource(ResourceId id, ExportedDescriptor* outDescriptor) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    Resource& resource = it->second;
    if (resource.sharedMemory) {
        // The mapping stays valid after the handle is released.
        outDescriptor->descriptor = ManagedDescriptor(resource.sharedMemory->releaseHandle());
    } else if (resource.descriptor.get()) {
        outDescriptor->descriptor = std::move(resource.descriptor);
    } else {
        return BrokerResult::kUnsupported;
    }
    outDescriptor->handleType = kMemHandleTypeShm;
    return BrokerResult::kOk;
}

void CrossDomainBackend::destroyResource(ResourceId id) {
    AutoLock lock(mLock);
    mResources.erase(id);
}

}  // namespace gfxbroker

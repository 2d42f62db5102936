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

#include <gtest/gtest.h>

#include <fcntl.h>
#include <stdlib.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cstring>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "CrossDomainBackend.h"
#include "VirtioGpuFormats.h"
#include "aemu/base/synchronization/ConditionVariable.h"
#include "aemu/base/synchronization/Lock.h"
#include "aemu/base/system/System.h"

namespace gfxbroker {
namespace {

using android::base::AutoLock;
using android::base::ManagedDescriptor;

class RecordingHost : public BackendHost {
   public:
    BrokerResult signalFence(const FenceRing& ring, FenceId id) override {
        AutoLock lock(mLock);
        mSignaled.push_back(FenceCompletion{.id = id, .ring = ring});
        mCv.broadcast();
        return BrokerResult::kOk;
    }
    BrokerResult lookupResource(ResourceId, ResourceInfo*) const override {
        return BrokerResult::kNotFound;
    }
    BrokerResult duplicateResourceHandle(ResourceId id, ManagedDescriptor* outDescriptor,
                                         uint32_t* outHandleType) override {
        auto it = exported.find(id);
        if (it == exported.end()) {
            return BrokerResult::kNotFound;
        }
        *outDescriptor = ManagedDescriptor(dup(*it->second.get()));
        *outHandleType = kMemHandleTypeShm;
        return BrokerResult::kOk;
    }

    // Returns once count fences were signaled or a few seconds passed.
    std::vector<FenceCompletion> waitForSignals(size_t count) {
        AutoLock lock(mLock);
        const uint64_t deadline = android::base::getUnixTimeUs() + 5000000;
        while (mSignaled.size() < count && android::base::getUnixTimeUs() < deadline) {
            mCv.timedWait(&mLock, deadline);
        }
        return mSignaled;
    }

    std::vector<FenceCompletion> signaled() {
        AutoLock lock(mLock);
        return mSignaled;
    }

    std::map<ResourceId, ManagedDescriptor> exported;

   private:
    android::base::Lock mLock;
    android::base::ConditionVariable mCv;
    std::vector<FenceCompletion> mSignaled;
};

template <typename T>
std::vector<uint8_t> commandBytes(const T& cmd, const std::string& payload = {}) {
    std::vector<uint8_t> bytes(sizeof(cmd) + payload.size());
    memcpy(bytes.data(), &cmd, sizeof(cmd));
    memcpy(bytes.data() + sizeof(cmd), payload.data(), payload.size());
    return bytes;
}

std::vector<uint8_t> initCommand(uint32_t queryRing, uint32_t channelRing,
                                 uint32_t channelType = kCrossDomainChannelTypeWayland) {
    CrossDomainInit init;
    memset(&init, 0, sizeof(init));
    init.hdr.cmd = kCrossDomainCmdInit;
    init.hdr.cmd_size = sizeof(init);
    init.query_ring_id = queryRing;
    init.channel_ring_id = channelRing;
    init.channel_type = channelType;
    return commandBytes(init);
}

std::vector<uint8_t> imageRequirementsCommand(uint32_t width, uint32_t height, uint32_t format) {
    CrossDomainGetImageRequirements cmd;
    memset(&cmd, 0, sizeof(cmd));
    cmd.hdr.cmd = kCrossDomainCmdGetImageRequirements;
    cmd.hdr.cmd_size = sizeof(cmd);
    cmd.width = width;
    cmd.height = height;
    cmd.drm_format = format;
    return commandBytes(cmd);
}

std::vector<uint8_t> pollCommand() {
    CrossDomainHeader poll;
    memset(&poll, 0, sizeof(poll));
    poll.cmd = kCrossDomainCmdPoll;
    poll.cmd_size = sizeof(poll);
    return commandBytes(poll);
}

std::vector<uint8_t> sendCommand(const std::string& data,
                                 const std::vector<std::pair<uint32_t, uint32_t>>& ids = {}) {
    CrossDomainSendReceive send;
    memset(&send, 0, sizeof(send));
    send.hdr.cmd = kCrossDomainCmdSend;
    send.hdr.cmd_size = static_cast<uint16_t>(sizeof(send) + data.size());
    send.num_identifiers = static_cast<uint32_t>(ids.size());
    send.opaque_data_size = static_cast<uint32_t>(data.size());
    for (size_t i = 0; i < ids.size() && i < kCrossDomainMaxIdentifiers; ++i) {
        send.identifiers[i] = ids[i].first;
        send.identifier_types[i] = ids[i].second;
    }
    return commandBytes(send, data);
}

std::vector<uint8_t> writeCommand(uint32_t identifier, const std::string& data, bool hangUp) {
    CrossDomainReadWrite write;
    memset(&write, 0, sizeof(write));
    write.hdr.cmd = kCrossDomainCmdWrite;
    write.hdr.cmd_size = static_cast<uint16_t>(sizeof(write) + data.size());
    write.identifier = identifier;
    write.hang_up = hangUp ? 1 : 0;
    write.opaque_data_size = static_cast<uint32_t>(data.size());
    return commandBytes(write, data);
}

Fence ringFence(FenceId id, uint8_t ringIdx) {
    return Fence{.id = id, .ring = FenceRingContextSpecific{1, ringIdx}};
}

// The compositor side of the channel.
std::string receiveFromHost(int fd, std::vector<ManagedDescriptor>* outDescriptors) {
    char data[256];
    alignas(cmsghdr) char control[CMSG_SPACE(sizeof(int) * kCrossDomainMaxIdentifiers)];
    iovec iov{data, sizeof(data)};
    msghdr msg;
    memset(&msg, 0, sizeof(msg));
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    msg.msg_control = control;
    msg.msg_controllen = sizeof(control);
    ssize_t size = recvmsg(fd, &msg, 0);
    if (size < 0) {
        return {};
    }
    for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg); cmsg; cmsg = CMSG_NXTHDR(&msg, cmsg)) {
        const size_t count = (cmsg->cmsg_len - CMSG_LEN(0)) / sizeof(int);
        for (size_t i = 0; i < count; ++i) {
            int descriptor;
            memcpy(&descriptor, CMSG_DATA(cmsg) + i * sizeof(int), sizeof(int));
            outDescriptors->emplace_back(descriptor);
        }
    }
    return std::string(data, static_cast<size_t>(size));
}

bool sendToHost(int fd, const std::string& data, int descriptor) {
    alignas(cmsghdr) char control[CMSG_SPACE(sizeof(int))];
    iovec iov{const_cast<char*>(data.data()), data.size()};
    msghdr msg;
    memset(&msg, 0, sizeof(msg));
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    if (descriptor >= 0) {
        memset(control, 0, sizeof(control));
        msg.msg_control = control;
        msg.msg_controllen = sizeof(control);
        cmsghdr* cmsg = CMSG_FIRSTHDR(&msg);
        cmsg->cmsg_level = SOL_SOCKET;
        cmsg->cmsg_type = SCM_RIGHTS;
        cmsg->cmsg_len = CMSG_LEN(sizeof(int));
        memcpy(CMSG_DATA(cmsg), &descriptor, sizeof(int));
    }
    return sendmsg(fd, &msg, MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
}

class CrossDomainBackendTest : public ::testing::Test {
   protected:
    CrossDomainBackendTest()
        : mBackend(1u << kCrossDomainChannelTypeWayland,
                   [this](uint32_t, ManagedDescriptor* outChannel) {
                       int fds[2];
                       if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
                           return BrokerResult::kBackendFailure;
                       }
                       *outChannel = ManagedDescriptor(fds[0]);
                       mPeer = ManagedDescriptor(fds[1]);
                       return BrokerResult::kOk;
                   }) {}

    void SetUp() override {
        ASSERT_EQ(mBackend.initialize(&mHost), BrokerResult::kOk);
        ASSERT_EQ(mBackend.createContext(1, kCapsetCrossDomain, "wayland", &mContext),
                  BrokerResult::kOk);
        mQueryRing.resize(4096);
        mChannelRing.resize(4096);
        ASSERT_EQ(mContext->attachResource(ContextResource{
                      .id = 10,
                      .blobMem = kBlobMemGuest,
                      .iovecs = {iovec{mQueryRing.data(), mQueryRing.size()}}}),
                  BrokerResult::kOk);
        ASSERT_EQ(mContext->attachResource(ContextResource{
                      .id = 11,
                      .blobMem = kBlobMemGuest,
                      .iovecs = {iovec{mChannelRing.data(), mChannelRing.size()}}}),
                  BrokerResult::kOk);
    }

    BrokerResult submit(const std::vector<uint8_t>& bytes, const Fence& fence,
                        base::AsyncResult* result) {
        return mContext->submit(CommandBuffer{bytes.data(), bytes.size()}, fence, result);
    }

    void initialize() {
        base::AsyncResult result;
        ASSERT_EQ(submit(initCommand(10, 11), ringFence(1, kCrossDomainQueryRing), &result),
                  BrokerResult::kOk);
        ASSERT_TRUE(mPeer.get().has_value());
    }

    CrossDomainImageRequirements queryReply() const {
        CrossDomainImageRequirements reply;
        memcpy(&reply, mQueryRing.data(), sizeof(reply));
        return reply;
    }

    template <typename T>
    T channelReply(std::string* outPayload) const {
        T reply;
        memcpy(&reply, mChannelRing.data(), sizeof(reply));
        outPayload->assign(reinterpret_cast<const char*>(mChannelRing.data()) + sizeof(reply),
                           reply.opaque_data_size);
        return reply;
    }

    RecordingHost mHost;
    ManagedDescriptor mPeer;
    CrossDomainBackend mBackend;
    std::unique_ptr<BackendContext> mContext;
    std::vector<uint8_t> mQueryRing;
    std::vector<uint8_t> mChannelRing;
};

TEST(CrossDomainCapsetTest, AdvertisesSupportedChannels) {
    CrossDomainBackend backend((1u << kCrossDomainChannelTypeWayland) |
                               (1u << kCrossDomainChannelTypeCameraStub));
    auto capsets = backend.capsets();
    ASSERT_EQ(capsets.size(), 1u);
    EXPECT_EQ(capsets[0].id, kCapsetCrossDomain);
    EXPECT_EQ(capsets[0].version, kCrossDomainCapsetVersion);
    ASSERT_EQ(capsets[0].data.size(), sizeof(CrossDomainCapabilities));

    CrossDomainCapabilities caps;
    memcpy(&caps, capsets[0].data.data(), sizeof(caps));
    EXPECT_EQ(caps.version, kCrossDomainCapsetVersion);
    EXPECT_EQ(caps.supported_channels, 0x6u);
    EXPECT_EQ(caps.supports_dmabuf, 0u);
}

TEST(CrossDomainImageRequirementsTest, PackedFormatsUseAlignedStride) {
    CrossDomainImageRequirements reqs;
    ASSERT_EQ(computeLinearImageRequirements(100, 10, kDrmFormatXrgb8888, &reqs),
              BrokerResult::kOk);
    EXPECT_EQ(reqs.strides[0], 448u);
    EXPECT_EQ(reqs.offsets[0], 0u);
    EXPECT_EQ(reqs.size, 8192u);
    EXPECT_EQ(reqs.modifier, 0u);
    EXPECT_EQ(reqs.memory_idx, -1);
}

TEST(CrossDomainImageRequirementsTest, Nv12HasTwoPlanes) {
    CrossDomainImageRequirements reqs;
    ASSERT_EQ(computeLinearImageRequirements(64, 64, kDrmFormatNv12, &reqs), BrokerResult::kOk);
    EXPECT_EQ(reqs.strides[0], 64u);
    EXPECT_EQ(reqs.strides[1], 64u);
    EXPECT_EQ(reqs.offsets[1], 64u * 64u);
    EXPECT_EQ(reqs.size, 8192u);
}

TEST(CrossDomainImageRequirementsTest, RejectsBadDimensionsAndFormats) {
    CrossDomainImageRequirements reqs;
    EXPECT_EQ(computeLinearImageRequirements(0, 10, kDrmFormatXrgb8888, &reqs),
              BrokerResult::kInvalidArgument);
    EXPECT_EQ(computeLinearImageRequirements(10, 10, 0x12345678, &reqs),
              BrokerResult::kUnsupported);
}

TEST_F(CrossDomainBackendTest, ImageRequirementsAreWrittenToTheQueryRing) {
    base::AsyncResult result;
    ASSERT_EQ(submit(initCommand(10, 11), ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kOk);
    EXPECT_EQ(result.Value(), base::AsyncResult::OK_AND_CALLBACK_NOT_SCHEDULED);

    ASSERT_EQ(submit(imageRequirementsCommand(100, 10, kDrmFormatXrgb8888),
                     ringFence(2, kCrossDomainQueryRing), &result),
              BrokerResult::kOk);
    EXPECT_EQ(result.Value(), base::AsyncResult::OK_AND_CALLBACK_NOT_SCHEDULED);

    CrossDomainImageRequirements first = queryReply();
    EXPECT_EQ(first.blob_id, 1u);
    EXPECT_EQ(first.strides[0], 448u);
    EXPECT_EQ(first.size, 8192u);

    ASSERT_EQ(submit(imageRequirementsCommand(16, 16, kDrmFormatXrgb8888),
                     ringFence(3, kCrossDomainQueryRing), &result),
              BrokerResult::kOk);
    EXPECT_EQ(queryReply().blob_id, 2u);
}

TEST_F(CrossDomainBackendTest, LegacyInitSharesTheQueryRing) {
    CrossDomainInitLegacy init;
    memset(&init, 0, sizeof(init));
    init.hdr.cmd = kCrossDomainCmdInit;
    init.hdr.cmd_size = sizeof(init);
    init.query_ring_id = 10;
    init.channel_type = kCrossDomainChannelTypeWayland;

    base::AsyncResult result;
    EXPECT_EQ(submit(commandBytes(init), ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kOk);
    EXPECT_TRUE(mPeer.get().has_value());
}

TEST_F(CrossDomainBackendTest, InitRequiresAttachedRings) {
    base::AsyncResult result;
    EXPECT_EQ(submit(initCommand(10, 99), ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);
}

TEST_F(CrossDomainBackendTest, RequirementsBeforeInitAreRejected) {
    base::AsyncResult result;
    EXPECT_EQ(submit(imageRequirementsCommand(16, 16, kDrmFormatXrgb8888),
                     ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);
}

TEST_F(CrossDomainBackendTest, MalformedStreamsAreRejected) {
    base::AsyncResult result;
    std::vector<uint8_t> truncated = initCommand(10, 11);
    truncated.resize(6);
    EXPECT_EQ(submit(truncated, ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);

    std::vector<uint8_t> oversized = initCommand(10, 11);
    oversized[2] = 0xff;
    EXPECT_EQ(submit(oversized, ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);

    CrossDomainHeader send;
    memset(&send, 0, sizeof(send));
    send.cmd = kCrossDomainCmdSend;
    send.cmd_size = sizeof(send);
    EXPECT_EQ(submit(commandBytes(send), ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);

    CrossDomainHeader receive = send;
    receive.cmd = kCrossDomainCmdReceive;
    EXPECT_EQ(submit(commandBytes(receive), ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kUnsupported);
}

TEST_F(CrossDomainBackendTest, InitHappensOnce) {
    initialize();
    base::AsyncResult result;
    EXPECT_EQ(submit(initCommand(10, 11), ringFence(2, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);
}

TEST_F(CrossDomainBackendTest, UnsupportedChannelTypesAreRejected) {
    base::AsyncResult result;
    EXPECT_EQ(submit(initCommand(10, 11, kCrossDomainChannelTypeCameraStub),
                     ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kUnsupported);
    EXPECT_FALSE(mPeer.get().has_value());
}

TEST_F(CrossDomainBackendTest, QueryOnlyContextsSignalChannelFencesRightAway) {
    base::AsyncResult result;
    ASSERT_EQ(submit(initCommand(10, 99, 0), ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kOk);
    EXPECT_FALSE(mPeer.get().has_value());

    ASSERT_EQ(submit(pollCommand(), ringFence(2, kCrossDomainChannelRing), &result),
              BrokerResult::kOk);
    EXPECT_EQ(result.Value(), base::AsyncResult::OK_AND_CALLBACK_NOT_SCHEDULED);
    EXPECT_EQ(submit(sendCommand("ping"), ringFence(3, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);
}

TEST(CrossDomainChannelTest, ChannelsNeedAConnector) {
    RecordingHost host;
    CrossDomainBackend backend;
    ASSERT_EQ(backend.initialize(&host), BrokerResult::kOk);
    std::unique_ptr<BackendContext> context;
    ASSERT_EQ(backend.createContext(1, kCapsetCrossDomain, "", &context), BrokerResult::kOk);
    std::vector<uint8_t> ring(4096);
    ASSERT_EQ(context->attachResource(ContextResource{
                  .id = 10, .iovecs = {iovec{ring.data(), ring.size()}}}),
              BrokerResult::kOk);

    std::vector<uint8_t> init = initCommand(10, 10);
    base::AsyncResult result;
    EXPECT_EQ(context->submit(CommandBuffer{init.data(), init.size()},
                              ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kUnsupported);
}

TEST_F(CrossDomainBackendTest, ChannelFencesWaitForTheChannel) {
    initialize();
    base::AsyncResult result;
    ASSERT_EQ(submit(pollCommand(), ringFence(7, kCrossDomainChannelRing), &result),
              BrokerResult::kOk);
    EXPECT_EQ(result.Value(), base::AsyncResult::OK_AND_CALLBACK_SCHEDULED);
    // Nothing has arrived on the channel yet.
    EXPECT_TRUE(mHost.signaled().empty());

    ASSERT_TRUE(sendToHost(*mPeer.get(), "hello", -1));
    auto signaled = mHost.waitForSignals(1);
    ASSERT_EQ(signaled.size(), 1u);
    EXPECT_EQ(signaled[0].id, 7u);
    EXPECT_EQ(signaled[0].ring, FenceRing(FenceRingContextSpecific{1, 1}));

    std::string payload;
    auto reply = channelReply<CrossDomainSendReceive>(&payload);
    EXPECT_EQ(reply.hdr.cmd, kCrossDomainCmdReceive);
    EXPECT_EQ(reply.num_identifiers, 0u);
    EXPECT_EQ(payload, "hello");
}

TEST_F(CrossDomainBackendTest, DestroyingTheContextCompletesChannelFences) {
    initialize();
    base::AsyncResult result;
    ASSERT_EQ(submit(pollCommand(), ringFence(7, kCrossDomainChannelRing), &result),
              BrokerResult::kOk);
    ASSERT_EQ(submit(pollCommand(), ringFence(8, kCrossDomainChannelRing), &result),
              BrokerResult::kOk);

    mContext.reset();
    auto signaled = mHost.signaled();
    ASSERT_EQ(signaled.size(), 2u);
    EXPECT_EQ(signaled[0].id, 7u);
    EXPECT_EQ(signaled[1].id, 8u);
}

TEST_F(CrossDomainBackendTest, SendForwardsDataToTheChannel) {
    initialize();
    base::AsyncResult result;
    ASSERT_EQ(submit(sendCommand("ping"), ringFence(2, kCrossDomainQueryRing), &result),
              BrokerResult::kOk);

    std::vector<ManagedDescriptor> descriptors;
    EXPECT_EQ(receiveFromHost(*mPeer.get(), &descriptors), "ping");
    EXPECT_TRUE(descriptors.empty());
}

TEST_F(CrossDomainBackendTest, SendSharesAttachedResources) {
    initialize();
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    ManagedDescriptor writeEnd(fds[1]);
    mHost.exported[12] = ManagedDescriptor(fds[0]);

    base::AsyncResult result;
    std::vector<uint8_t> send = sendCommand("buf", {{12, kCrossDomainIdTypeVirtgpuBlob}});
    EXPECT_EQ(submit(send, ringFence(2, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);

    ASSERT_EQ(mContext->attachResource(ContextResource{.id = 12}), BrokerResult::kOk);
    ASSERT_EQ(submit(send, ringFence(3, kCrossDomainQueryRing), &result), BrokerResult::kOk);

    std::vector<ManagedDescriptor> descriptors;
    EXPECT_EQ(receiveFromHost(*mPeer.get(), &descriptors), "buf");
    ASSERT_EQ(descriptors.size(), 1u);
    ASSERT_EQ(write(*writeEnd.get(), "x", 1), 1);
    char byte = 0;
    EXPECT_EQ(read(*descriptors[0].get(), &byte, 1), 1);
    EXPECT_EQ(byte, 'x');
}

TEST_F(CrossDomainBackendTest, SendRejectsTooManyIdentifiersAndUnknownTypes) {
    initialize();
    base::AsyncResult result;
    std::vector<uint8_t> send = sendCommand("x");
    CrossDomainSendReceive cmd;
    memcpy(&cmd, send.data(), sizeof(cmd));
    cmd.num_identifiers = kCrossDomainMaxIdentifiers + 1;
    memcpy(send.data(), &cmd, sizeof(cmd));
    EXPECT_EQ(submit(send, ringFence(2, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);

    EXPECT_EQ(submit(sendCommand("x", {{1, kCrossDomainIdTypeWritePipe}}),
                     ringFence(3, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);

    std::vector<uint8_t> truncated = sendCommand("abcd");
    memcpy(&cmd, truncated.data(), sizeof(cmd));
    cmd.opaque_data_size = 64;
    memcpy(truncated.data(), &cmd, sizeof(cmd));
    EXPECT_EQ(submit(truncated, ringFence(4, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);
}

TEST_F(CrossDomainBackendTest, ReadPipesReportDataThenHangUp) {
    initialize();
    const uint32_t pipeId = kCrossDomainPipeReadStart + 1;
    base::AsyncResult result;
    EXPECT_EQ(submit(sendCommand("offer", {{pipeId + 4, kCrossDomainIdTypeReadPipe}}),
                     ringFence(2, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);
    ASSERT_EQ(submit(sendCommand("offer", {{pipeId, kCrossDomainIdTypeReadPipe}}),
                     ringFence(3, kCrossDomainQueryRing), &result),
              BrokerResult::kOk);

    std::vector<ManagedDescriptor> descriptors;
    EXPECT_EQ(receiveFromHost(*mPeer.get(), &descriptors), "offer");
    ASSERT_EQ(descriptors.size(), 1u);
    ASSERT_EQ(write(*descriptors[0].get(), "abc", 3), 3);

    ASSERT_EQ(submit(pollCommand(), ringFence(4, kCrossDomainChannelRing), &result),
              BrokerResult::kOk);
    ASSERT_EQ(mHost.waitForSignals(1).size(), 1u);
    std::string payload;
    auto reply = channelReply<CrossDomainReadWrite>(&payload);
    EXPECT_EQ(reply.hdr.cmd, kCrossDomainCmdRead);
    EXPECT_EQ(reply.identifier, pipeId);
    EXPECT_EQ(reply.hang_up, 0u);
    EXPECT_EQ(payload, "abc");

    descriptors.clear();
    ASSERT_EQ(submit(pollCommand(), ringFence(5, kCrossDomainChannelRing), &result),
              BrokerResult::kOk);
    ASSERT_EQ(mHost.waitForSignals(2).size(), 2u);
    reply = channelReply<CrossDomainReadWrite>(&payload);
    EXPECT_EQ(reply.identifier, pipeId);
    EXPECT_EQ(reply.hang_up, 1u);
    EXPECT_TRUE(payload.empty());
}

TEST_F(CrossDomainBackendTest, ReceivedWritePipesTakeWrites) {
    initialize();
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    ManagedDescriptor readEnd(fds[0]);
    {
        ManagedDescriptor writeEnd(fds[1]);
        ASSERT_TRUE(sendToHost(*mPeer.get(), "paste", fds[1]));
    }

    base::AsyncResult result;
    ASSERT_EQ(submit(pollCommand(), ringFence(2, kCrossDomainChannelRing), &result),
              BrokerResult::kOk);
    ASSERT_EQ(mHost.waitForSignals(1).size(), 1u);
    std::string payload;
    auto reply = channelReply<CrossDomainSendReceive>(&payload);
    EXPECT_EQ(reply.hdr.cmd, kCrossDomainCmdReceive);
    EXPECT_EQ(payload, "paste");
    ASSERT_EQ(reply.num_identifiers, 1u);
    EXPECT_EQ(reply.identifier_types[0], kCrossDomainIdTypeWritePipe);
    const uint32_t pipeId = reply.identifiers[0];

    ASSERT_EQ(submit(writeCommand(pipeId, "xyz", true), ringFence(3, kCrossDomainQueryRing),
                     &result),
              BrokerResult::kOk);
    char data[8];
    EXPECT_EQ(read(*readEnd.get(), data, sizeof(data)), 3);
    EXPECT_EQ(std::string(data, 3), "xyz");
    // Hanging up closed the last write end.
    EXPECT_EQ(read(*readEnd.get(), data, sizeof(data)), 0);

    EXPECT_EQ(submit(writeCommand(pipeId, "more", false), ringFence(4, kCrossDomainQueryRing),
                     &result),
              BrokerResult::kInvalidArgument);
}

TEST_F(CrossDomainBackendTest, ReceivedMemoryBecomesABlob) {
    initialize();
    ManagedDescriptor memory(memfd_create("gfxbroker-test", MFD_CLOEXEC));
    ASSERT_TRUE(memory.get().has_value());
    ASSERT_EQ(ftruncate(*memory.get(), 8192), 0);
    ASSERT_TRUE(sendToHost(*mPeer.get(), "image", *memory.get()));

    base::AsyncResult result;
    ASSERT_EQ(submit(pollCommand(), ringFence(2, kCrossDomainChannelRing), &result),
              BrokerResult::kOk);
    ASSERT_EQ(mHost.waitForSignals(1).size(), 1u);
    std::string payload;
    auto reply = channelReply<CrossDomainSendReceive>(&payload);
    ASSERT_EQ(reply.num_identifiers, 1u);
    EXPECT_EQ(reply.identifier_types[0], kCrossDomainIdTypeVirtgpuBlob);
    EXPECT_EQ(reply.identifier_sizes[0], 8192u);

    BlobCreateArgs args{.ctxId = 1,
                        .blobMem = kBlobMemHost3d,
                        .blobFlags = kBlobFlagUseMappable,
                        .blobId = reply.identifiers[0],
                        .size = 16384};
    BackendResource out;
    EXPECT_EQ(mContext->createBlob(20, args, &out), BrokerResult::kInvalidArgument);
    args.size = 8192;
    ASSERT_EQ(mContext->createBlob(20, args, &out), BrokerResult::kOk);
    EXPECT_EQ(out.size, 8192u);
    EXPECT_EQ(out.mapping.hva, nullptr);
    // The descriptor moved into the resource.
    EXPECT_EQ(mContext->createBlob(21, args, &out), BrokerResult::kInvalidArgument);

    ExportedDescriptor exported;
    ASSERT_EQ(mBackend.exportResource(20, &exported), BrokerResult::kOk);
    ASSERT_TRUE(exported.descriptor.get().has_value());
    EXPECT_EQ(lseek(*exported.descriptor.get(), 0, SEEK_END), 8192);
}

TEST_F(CrossDomainBackendTest, PeerHangUpCompletesChannelFences) {
    initialize();
    mPeer = ManagedDescriptor();

    base::AsyncResult result;
    ASSERT_EQ(submit(pollCommand(), ringFence(2, kCrossDomainChannelRing), &result),
              BrokerResult::kOk);
    ASSERT_EQ(mHost.waitForSignals(1).size(), 1u);
    ASSERT_EQ(submit(pollCommand(), ringFence(3, kCrossDomainChannelRing), &result),
              BrokerResult::kOk);
    EXPECT_EQ(mHost.waitForSignals(2).size(), 2u);
    EXPECT_EQ(submit(sendCommand("late"), ringFence(4, kCrossDomainQueryRing), &result),
              BrokerResult::kInvalidArgument);
}

TEST(CrossDomainConnectorTest, ConnectsToRegisteredSockets) {
    char dir[] = "/tmp/gfxbroker-XXXXXX";
    ASSERT_NE(mkdtemp(dir), nullptr);
    const std::string path = std::string(dir) + "/wayland-0";

    ManagedDescriptor listener(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    ASSERT_TRUE(listener.get().has_value());
    sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    memcpy(addr.sun_path, path.c_str(), path.size());
    ASSERT_EQ(bind(*listener.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(listen(*listener.get(), 1), 0);

    CrossDomainConnector connector = unixSocketConnector(
        {{kCrossDomainChannelTypeWayland, path},
         {kCrossDomainChannelTypeCameraStub, std::string(200, 'a')}});
    ManagedDescriptor channel;
    ASSERT_EQ(connector(kCrossDomainChannelTypeWayland, &channel), BrokerResult::kOk);
    EXPECT_TRUE(channel.get().has_value());
    ManagedDescriptor accepted(accept(*listener.get(), nullptr, nullptr));
    EXPECT_TRUE(accepted.get().has_value());

    EXPECT_EQ(connector(kCrossDomainChannelTypeCameraStub, &channel),
              BrokerResult::kInvalidArgument);
    EXPECT_EQ(connector(7, &channel), BrokerResult::kUnsupported);

    unlink(path.c_str());
    EXPECT_EQ(connector(kCrossDomainChannelTypeWayland, &channel),
              BrokerResult::kBackendFailure);
    rmdir(dir);
}

TEST_F(CrossDomainBackendTest, UnknownRingsAreRejected) {
    base::AsyncResult result;
    EXPECT_EQ(submit({}, ringFence(1, 2), &result), BrokerResult::kInvalidArgument);
    EXPECT_EQ(submit({}, Fence{.id = 1, .ring = FenceRingGlobal{}}, &result),
              BrokerResult::kInvalidArgument);
}

TEST_F(CrossDomainBackendTest, ItemBlobsAreSharedMemory) {
    base::AsyncResult result;
    ASSERT_EQ(submit(initCommand(10, 11), ringFence(1, kCrossDomainQueryRing), &result),
              BrokerResult::kOk);
    ASSERT_EQ(submit(imageRequirementsCommand(32, 32, kDrmFormatXrgb8888),
                     ringFence(2, kCrossDomainQueryRing), &result),
              BrokerResult::kOk);
    CrossDomainImageRequirements reqs = queryReply();

    BlobCreateArgs args{.ctxId = 1,
                        .blobMem = kBlobMemHost3d,
                        .blobFlags = kBlobFlagUseMappable | kBlobFlagUseShareable,
                        .blobId = reqs.blob_id,
                        .size = reqs.size - 1};
    BackendResource out;
    EXPECT_EQ(mContext->createBlob(20, args, &out), BrokerResult::kInvalidArgument);

    args.size = reqs.size;
    ASSERT_EQ(mContext->createBlob(20, args, &out), BrokerResult::kOk);
    EXPECT_EQ(out.size, reqs.size);
    ASSERT_NE(out.mapping.hva, nullptr);
    EXPECT_EQ(out.mapInfo & kMapCacheMask, kMapCacheCached);
    static_cast<uint8_t*>(out.mapping.hva)[0] = 0x5a;

    ExportedDescriptor exported;
    ASSERT_EQ(mBackend.exportResource(20, &exported), BrokerResult::kOk);
    EXPECT_EQ(exported.handleType, kMemHandleTypeShm);
    EXPECT_TRUE(exported.descriptor.get().has_value());

    args.blobId = 42;
    EXPECT_EQ(mContext->createBlob(21, args, &out), BrokerResult::kInvalidArgument);
    mBackend.destroyResource(20);
    EXPECT_EQ(mBackend.exportResource(20, &exported), BrokerResult::kNotFound);
}

TEST_F(CrossDomainBackendTest, GuestBlobsHaveNothingToExport) {
    std::vector<uint8_t> pages(4096);
    BlobCreateArgs args{.blobMem = kBlobMemGuest, .size = pages.size()};
    BackendResource out;
    ASSERT_EQ(mBackend.createBlob(30, args, {iovec{pages.data(), pages.size()}}, &out),
              BrokerResult::kOk);
    EXPECT_EQ(out.mapping.hva, nullptr);
    EXPECT_EQ(mBackend.transferToHost(1, 30, TransferBox{}), BrokerResult::kOk);

    ExportedDescriptor exported;
    EXPECT_EQ(mBackend.exportResource(30, &exported), BrokerResult::kUnsupported);
    EXPECT_EQ(mBackend.createResource(31, ResourceCreateArgs{}, &out),
              BrokerResult::kUnsupported);
}

}  // namespace
}  // namespace gfxbroker

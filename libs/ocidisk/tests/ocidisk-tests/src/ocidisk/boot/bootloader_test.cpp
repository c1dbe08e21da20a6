// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "common/tempdir.h"
#include "ocidisk/boot/bootloader.h"
#include "ocidisk/common/strings.h"
#include "ocidisk/mocks/command_mock.h"
#include "ocidisk/utils/file.h"

#include <algorithm>

using namespace ocidisk::boot;
using ocidisk::utils::error::ErrorCode;
using ocidisk::utils::error::Result;

namespace {

// Skips the API filesystem mounts, which need privileges.
class UnprivilegedBootloaderAdapter : public BootloaderAdapter
{
public:
    using BootloaderAdapter::BootloaderAdapter;

protected:
    Result<std::unique_ptr<ChrootSession>> openChroot() noexcept override
    {
        ChrootOptions options;
        options.mountApiFilesystems = false;
        options.hostResolvConf = root() / "nonexistent";
        return ChrootSession::open(root(), options);
    }
};

bool hasArg(const RecordedCall &call, const std::string &arg)
{
    return std::find(call.begin(), call.end(), arg) != call.end();
}

} // namespace

class BootloaderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        root = tmp.path();
        std::filesystem::create_directories(root / "etc");
        std::filesystem::create_directories(root / "boot/efi");

        config.rootUuid = "5b1a9d2e-3c4f-4a6b-8d7e-9f0a1b2c3d4e";
        config.espUuid = "1A2B-3C4D";
        config.machineId = generateMachineId();
        config.hostname = "builder";
        config.loopDevice = "/dev/loop7";
    }

    // Pretends to be apt, grub and initramfs-tools inside the chroot.
    ocidisk::utils::CmdFactory fakeChroot(const std::string &failing = {})
    {
        return recordingFactory(calls, [this, failing](const RecordedCall &call) -> Result<std::string> {
            OCIDISK_TRACE("fake chroot");
            if (call.size() < 3 || call[0] != "chroot" || call[1] != root.string()) {
                return OCIDISK_ERR("unexpected command");
            }
            const auto &program = call[2];
            if (program == failing) {
                return OCIDISK_ERR(program + " exited with status 1");
            }
            if (program == "grub-install") {
                deviceMapSeen = std::filesystem::exists(root / "boot/grub/device.map");
                std::filesystem::create_directories(root / "boot/efi/EFI/BOOT");
                auto ret = ocidisk::utils::writeFile(root / "boot/efi/EFI/BOOT/BOOTX64.EFI", "efi");
                if (!ret) {
                    return OCIDISK_ERR(ret);
                }
            }
            if (program == "update-initramfs" && createKernel) {
                auto ret = ocidisk::utils::writeFile(root / "boot/vmlinuz-6.1.0-18-amd64", "k");
                if (!ret) {
                    return OCIDISK_ERR(ret);
                }
                ret = ocidisk::utils::writeFile(root / "boot/initrd.img-6.1.0-18-amd64", "i");
                if (!ret) {
                    return OCIDISK_ERR(ret);
                }
            }
            return std::string{};
        });
    }

    TempDir tmp;
    std::filesystem::path root;
    BootConfig config;
    std::shared_ptr<std::vector<RecordedCall>> calls =
      std::make_shared<std::vector<RecordedCall>>();
    bool deviceMapSeen{ false };
    bool createKernel{ true };
};

TEST_F(BootloaderTest, FullSequence)
{
    UnprivilegedBootloaderAdapter adapter(root, Debian{}, fakeChroot());
    EXPECT_EQ(adapter.state(), BootState::Unconfigured);
    EXPECT_EQ(adapter.session(), nullptr);

    auto ret = adapter.prepareChroot();
    ASSERT_TRUE(ret) << ret.error().message();
    EXPECT_EQ(adapter.state(), BootState::ChrootReady);
    ASSERT_NE(adapter.session(), nullptr);
    EXPECT_TRUE(std::filesystem::exists(root / "usr/sbin/policy-rc.d"));

    ret = adapter.installBootloader(config, { "openssh-server" });
    ASSERT_TRUE(ret) << ret.error().message();
    EXPECT_EQ(adapter.state(), BootState::BootloaderInstalled);
    EXPECT_EQ(config.kernel.version, "6.1.0-18-amd64");

    ASSERT_EQ(calls->size(), 5);
    EXPECT_EQ((*calls)[0], (RecordedCall{ "chroot", root.string(), "apt-get", "update" }));
    const auto &install = (*calls)[1];
    EXPECT_TRUE(hasArg(install, "--no-install-recommends"));
    EXPECT_TRUE(hasArg(install, "linux-image-amd64"));
    EXPECT_TRUE(hasArg(install, "grub-efi-amd64-bin"));
    EXPECT_EQ(install.back(), "openssh-server");
    EXPECT_EQ((*calls)[2][2], "grub-install");
    EXPECT_TRUE(hasArg((*calls)[2], "--removable"));
    EXPECT_TRUE(hasArg((*calls)[2], "--bootloader-id=debian"));
    EXPECT_EQ((*calls)[3], (RecordedCall{ "chroot", root.string(), "grub-mkconfig", "-o",
                                          "/boot/grub/grub.cfg" }));
    EXPECT_EQ((*calls)[4][2], "update-initramfs");

    EXPECT_TRUE(deviceMapSeen);
    EXPECT_FALSE(std::filesystem::exists(root / "boot/grub/device.map"));
    auto grub = ocidisk::utils::readFile(root / "etc/default/grub");
    ASSERT_TRUE(grub);
    EXPECT_TRUE(ocidisk::common::strings::contains(*grub, "GRUB_DISTRIBUTOR=\"debian\""));

    ret = adapter.configureSystem(config);
    ASSERT_TRUE(ret) << ret.error().message();
    EXPECT_EQ(adapter.state(), BootState::Configured);
    EXPECT_EQ(*ocidisk::utils::readFile(root / "etc/hostname"), "builder\n");
    EXPECT_EQ(*ocidisk::utils::readFile(root / "etc/machine-id"), config.machineId + "\n");
    EXPECT_EQ(*ocidisk::utils::readFile(root / "etc/fstab"), renderFstab(config));
    EXPECT_EQ(*ocidisk::utils::readFile(root / "etc/hosts"), renderHosts(config));

    ASSERT_TRUE(adapter.session()->restoreFiles());
    EXPECT_FALSE(std::filesystem::exists(root / "usr/sbin/policy-rc.d"));
}

TEST_F(BootloaderTest, StepsOutOfOrder)
{
    UnprivilegedBootloaderAdapter adapter(root, Ubuntu{}, fakeChroot());

    auto ret = adapter.installBootloader(config, {});
    ASSERT_FALSE(ret);
    EXPECT_FALSE(ret.error().is(ErrorCode::BootloaderInstallFailure));

    ret = adapter.configureSystem(config);
    ASSERT_FALSE(ret);
    EXPECT_TRUE(calls->empty());

    ASSERT_TRUE(adapter.prepareChroot());
    ret = adapter.prepareChroot();
    ASSERT_FALSE(ret);
    EXPECT_EQ(adapter.state(), BootState::ChrootReady);
}

TEST_F(BootloaderTest, GrubInstallFailure)
{
    UnprivilegedBootloaderAdapter adapter(root, Debian{}, fakeChroot("grub-install"));
    ASSERT_TRUE(adapter.prepareChroot());

    auto ret = adapter.installBootloader(config, {});
    ASSERT_FALSE(ret);
    EXPECT_TRUE(ret.error().is(ErrorCode::BootloaderInstallFailure)) << ret.error().message();
    EXPECT_EQ(adapter.state(), BootState::ChrootReady);
    EXPECT_FALSE(std::filesystem::exists(root / "boot/grub/device.map"));
    EXPECT_EQ(calls->size(), 3);
}

TEST_F(BootloaderTest, MissingKernelAfterInstall)
{
    createKernel = false;
    UnprivilegedBootloaderAdapter adapter(root, Debian{}, fakeChroot());
    ASSERT_TRUE(adapter.prepareChroot());

    auto ret = adapter.installBootloader(config, {});
    ASSERT_FALSE(ret);
    EXPECT_TRUE(ret.error().is(ErrorCode::BootloaderInstallFailure)) << ret.error().message();
    EXPECT_EQ(adapter.state(), BootState::ChrootReady);
    EXPECT_EQ(calls->size(), 5);
}

TEST(BootState, Names)
{
    EXPECT_EQ(bootStateName(BootState::Unconfigured), "Unconfigured");
    EXPECT_EQ(fmt::format("{}", BootState::Configured), "Configured");
}

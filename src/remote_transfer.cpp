#include "remote_transfer.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <fcntl.h>
#include <fstream>
#include <memory>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

struct SessionCloser {
    void operator()(ssh_session session) const {
        if (ssh_is_connected(session)) {
            ssh_disconnect(session);
        }
        ssh_free(session);
    }
};

struct SftpCloser {
    void operator()(sftp_session sftp) const { sftp_free(sftp); }
};

struct RemoteFileCloser {
    void operator()(sftp_file file) const { sftp_close(file); }
};

using SessionHandle = std::unique_ptr<ssh_session_struct, SessionCloser>;
using SftpHandle = std::unique_ptr<sftp_session_struct, SftpCloser>;
using RemoteFileHandle = std::unique_ptr<sftp_file_struct, RemoteFileCloser>;

/**
 * @brief Creates every missing component of an absolute or relative remote directory.
 */
Result<void> ensureRemoteDirectory(sftp_session sftp, const std::string& remotePath) {
    std::string current;
    std::size_t pos = 0;
    while (pos <= remotePath.size()) {
        auto next = remotePath.find('/', pos);
        if (next == std::string::npos) {
            next = remotePath.size();
        }
        current = remotePath.substr(0, next);
        pos = next + 1;
        if (current.empty() || current.back() == '/') {
            continue;
        }
        if (sftp_attributes attrs = sftp_stat(sftp, current.c_str())) {
            sftp_attributes_free(attrs);
            continue;
        }
        if (sftp_mkdir(sftp, current.c_str(), 0755) != SSH_OK && sftp_get_error(sftp) != SSH_FX_FILE_ALREADY_EXISTS) {
            return std::unexpected(BackupError::storage(fmt::format("Failed to create remote directory: {}", current)));
        }
    }
    return {};
}

} // namespace

SFTPTransferStrategy::SFTPTransferStrategy(const StorageConfig& config)
    : host_(config.host),
      user_(config.user),
      password_(config.password),
      port_(config.port) {}

Result<void> SFTPTransferStrategy::transfer(const fs::path& localFile, const std::string& remotePath) {
    std::ifstream input(localFile, std::ios::binary);
    if (!input) {
        return std::unexpected(BackupError::storage(fmt::format("Failed to open local file: {}", localFile.string())));
    }

    SessionHandle session(ssh_new());
    if (!session) {
        return std::unexpected(BackupError::storage("Failed to create SSH session"));
    }
    ssh_options_set(session.get(), SSH_OPTIONS_HOST, host_.c_str());
    ssh_options_set(session.get(), SSH_OPTIONS_PORT, &port_);
    ssh_options_set(session.get(), SSH_OPTIONS_USER, user_.c_str());
    if (ssh_connect(session.get()) != SSH_OK) {
        return std::unexpected(BackupError::storage(
            fmt::format("SSH connection to {}:{} failed: {}", host_, port_, ssh_get_error(session.get()))));
    }

    int auth = password_.empty() ? ssh_userauth_publickey_auto(session.get(), nullptr, nullptr)
                                 : ssh_userauth_password(session.get(), nullptr, password_.c_str());
    if (auth != SSH_AUTH_SUCCESS) {
        return std::unexpected(BackupError::storage(
            fmt::format("SSH authentication failed for {}@{}: {}", user_, host_, ssh_get_error(session.get()))));
    }

    SftpHandle sftp(sftp_new(session.get()));
    if (!sftp || sftp_init(sftp.get()) != SSH_OK) {
        return std::unexpected(BackupError::storage(
            fmt::format("SFTP initialization failed: {}", ssh_get_error(session.get()))));
    }

    if (auto created = ensureRemoteDirectory(sftp.get(), remotePath); !created) {
        return created;
    }

    std::string remoteFile = fmt::format("{}/{}", remotePath, localFile.filename().string());
    RemoteFileHandle file(sftp_open(sftp.get(), remoteFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (!file) {
        return std::unexpected(BackupError::storage(fmt::format("Failed to open remote file: {}", remoteFile)));
    }

    char buf[16384];
    while (input) {
        input.read(buf, sizeof(buf));
        auto count = input.gcount();
        if (count > 0 && sftp_write(file.get(), buf, static_cast<size_t>(count)) != count) {
            return std::unexpected(BackupError::storage(fmt::format("Failed to write remote file: {}", remoteFile)));
        }
    }
    if (input.bad()) {
        return std::unexpected(BackupError::storage(fmt::format("Failed to read local file: {}", localFile.string())));
    }

    if (sftp_close(file.release()) != SSH_NO_ERROR) {
        return std::unexpected(BackupError::storage(fmt::format("Failed to close remote file: {}", remoteFile)));
    }
    return {};
}

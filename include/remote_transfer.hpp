/**
 * @file remote_transfer.hpp
 * @brief Uploads backup artifacts to a remote host over SFTP.
 *
 * @note Requires libssh.
 */

#ifndef REMOTE_TRANSFER_HPP
#define REMOTE_TRANSFER_HPP

#include <string>
#include <filesystem>
#include "backup_config.hpp"
#include "backup_error.hpp"

/**
 * @brief Interface for remote transfer strategies.
 */
class RemoteTransferStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~RemoteTransferStrategy() = default;

    /**
     * @brief Transfers a local file into a remote directory.
     *
     * @param localFile Path to the local file.
     * @param remotePath Remote directory path.
     * @return Result<void> Success or a Storage-kind error.
     */
    virtual Result<void> transfer(const std::filesystem::path& localFile, const std::string& remotePath) = 0;
};

/**
 * @brief SFTP remote transfer strategy.
 *
 * Authenticates with the configured password, or with the user's default public keys when
 * the password is empty.
 */
class SFTPTransferStrategy : public RemoteTransferStrategy {
public:
    /**
     * @brief Constructs an SFTP transfer strategy.
     *
     * @param config Storage settings with host, port, user and password.
     */
    explicit SFTPTransferStrategy(const StorageConfig& config);

    Result<void> transfer(const std::filesystem::path& localFile, const std::string& remotePath) override;

private:
    std::string host_;     ///< SFTP host address.
    std::string user_;     ///< SFTP username.
    std::string password_; ///< SFTP password.
    int port_;             ///< SFTP port (e.g., 22).
};

#endif // REMOTE_TRANSFER_HPP

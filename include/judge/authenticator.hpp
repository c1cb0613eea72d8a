#pragma once

#include <map>
#include <string>

namespace bridge {

/**
 * @brief 校验评测机的身份
 */
struct authenticator {
    virtual ~authenticator();

    /**
     * @brief 检查评测机提供的名称和密钥
     * @return 是否允许该评测机连接
     */
    virtual bool authenticate(const std::string &id, const std::string &key) = 0;
};

/**
 * @brief 根据配置文件中的评测机名称和密钥表进行认证
 */
struct key_authenticator : public authenticator {
    explicit key_authenticator(std::map<std::string, std::string> keys);

    bool authenticate(const std::string &id, const std::string &key) override;

private:
    std::map<std::string, std::string> keys;
};

}  // namespace bridge

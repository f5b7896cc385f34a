#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

#include <QString>

namespace lanpeer::network {

/**
 * ServiceRecord - What this process advertises over mDNS.
 *
 * Built once from Config and the bound transport port, then left unchanged.
 */
struct ServiceRecord {
    static constexpr int MAX_LABEL_BYTES = 63;
    static constexpr int MAX_TXT_BYTES = 255;

    QString service_type;   // "_example._udp.local."
    QString instance_name;  // "alice"
    QString host_name;      // "myhost.local."
    quint16 port = 0;
    Properties properties;

    // Addresses are filled in by the discovery backend from the
    // interfaces it publishes on.
    bool address_auto = true;

    /**
     * "<instance>.<service type>", e.g. "alice._example._udp.local."
     */
    [[nodiscard]] QString fullname() const;
};

/**
 * "_example._udp" -> "_example._udp.local."; already qualified names pass through.
 */
[[nodiscard]] QString qualified_service_type(const QString& service_name);

/**
 * "_example._udp.local." -> "_example._udp"
 */
[[nodiscard]] QString bare_service_type(const QString& service_type);

/**
 * Host name advertised for this machine, e.g. "myhost.local."
 */
[[nodiscard]] QString local_host_name();

/**
 * Validate the configuration and build the record to register.
 */
[[nodiscard]] Result<ServiceRecord> make_service_record(const Config& config,
                                                        quint16 port,
                                                        const QString& host_name);

} // namespace lanpeer::network

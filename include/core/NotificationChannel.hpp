// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_NOTIFICATION_CHANNEL_HPP
#define LANWATCH_NOTIFICATION_CHANNEL_HPP

#include <string>
#include <json/json.h>

namespace Lanwatch::Core {

    namespace Events {
        // Teljes SpeedSnapshot payload
        inline constexpr const char* DOWNLOAD_SPEED_UPDATE = "DownloadSpeedUpdate";
        // Payload nélkül: a megfigyelők frissítsék az aktív letöltések listáját
        inline constexpr const char* DOWNLOADS_REFRESH = "DownloadsRefresh";
    }

    /**
     * @brief "Értesíts minden megfigyelőt az E eseményről P payloaddal."
     */
    class NotificationChannel {
    public:
        virtual ~NotificationChannel() = default;

        virtual void notifyAll(const std::string& event, const Json::Value& payload) = 0;
    };
}

#endif

#pragma once
/** @file  SerialDevice.hpp
 *  @brief Base for instruments reached over one SerialChannel.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <initializer_list>
#include <memory>
#include <string>

// FlowCal headers
#include "devices/Capabilities.hpp"
#include "io/SerialChannel.hpp" // SerialDevice owns its channel and requires full type knowledge
#include "protocols/Command.hpp"

namespace flowcal::devices {

  /**
 * @class SerialDevice
 * @brief Owns one transport and turns its bool/optional results into the
 *        core error taxonomy.
 *
 *  * Settings are validated by the concrete model before the port is touched.
 *  * send()/query() treat a command and its reply as one atomic exchange.
 */
  class SerialDevice : public Instrument {
  public:
    SerialDevice(std::unique_ptr<io::SerialChannel> channel, io::SerialSettings settings);
    ~SerialDevice() override;

    //---Instrument-------------------------------------------------------
    void open() override; ///< validate → claim port → onOpened()
    void close() override;
    bool isOpen() const override;

    /// Replace the link settings; throws core::UnsupportedSettingError for this model.
    void configure(const io::SerialSettings& settings);
    const io::SerialSettings& settings() const { return settings_; }

    SerialDevice(const SerialDevice&) = delete;
    SerialDevice& operator=(const SerialDevice&) = delete;

  protected:
    /// Throws core::UnsupportedSettingError if the model cannot use \p settings.
    virtual void validate(const io::SerialSettings& settings) const = 0;

    /// Post-open handshake (address assignment, identity check…).
    virtual void onOpened() {}

    void send(const protocols::Command& cmd);
    std::string query(const protocols::Command& cmd);

    //---validation helpers for concrete models---------------------------
    void requireBaud(int baud, std::initializer_list<int> supported) const;
    void requireFraming(const io::SerialSettings& s, std::initializer_list<int> dataBits,
                        std::initializer_list<io::Parity> parities,
                        std::initializer_list<io::StopBits> stopBits) const;

  private:
    std::unique_ptr<io::SerialChannel> channel_;
    io::SerialSettings settings_;
  };

} // namespace flowcal::devices

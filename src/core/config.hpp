/**
 * @file   config.hpp
 * @brief  Defines the superuser bridge configuration model and its JSON
 *         loader.
 *
 * A configuration file looks like
 * @code
 * { "superuser-bridges": [
 *     { "label": "sudo",
 *       "spawn": ["sudo", "-n", "muxbridge", "--privileged"],
 *       "environ": ["LANG=C"],
 *       "privileged": true } ] }
 * @endcode
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #ifndef MUXBRIDGE_CONFIG_HPP
 #define MUXBRIDGE_CONFIG_HPP

 #include <string>
 #include <vector>
 #include <nlohmann/json.hpp>

 namespace muxbridge::config {

 /**
  * @struct SuperuserBridge
  * @brief How to spawn one privileged peer.
  */
 struct SuperuserBridge {
     std::string              label;              ///< Name used by Start() and init
     std::vector<std::string> spawn;              ///< argv; spawn[0] is looked up in PATH
     std::vector<std::string> environ;            ///< Extra KEY=VALUE entries
     bool                     privileged = false; ///< Only privileged bridges are offered
 };

 /**
  * @struct BridgeConfig
  * @brief Everything the bridge reads from its configuration file.
  */
 struct BridgeConfig {
     std::vector<SuperuserBridge> superuserBridges;  ///< In file order
 };

 /**
  * @brief Built-in configuration: sudo and pkexec wrapping a privileged
  *        muxbridge.
  */
 BridgeConfig defaults();

 /**
  * @brief Parse a configuration document.
  *
  * Entries without `spawn` (or with an empty one) make the document
  * invalid.  A missing label defaults to the base name of spawn[0].  A
  * repeated label is dropped and reported as a warning.
  *
  * @param text  JSON text.
  * @param out   Receives the configuration on success.
  * @param err   Optional out-param for an error, or a warning on success.
  * @return      false on parse or schema errors.
  */
 bool loadString(const std::string& text, BridgeConfig& out, std::string* err = nullptr);

 /**
  * @brief Read and parse a configuration file.  Same contract as
  *        loadString(), plus I/O errors.
  */
 bool loadFile(const std::string& path, BridgeConfig& out, std::string* err = nullptr);

 } // namespace muxbridge::config

 // ----------------------------------------------------------------------------
 // nlohmann::json ADL serializers for configuration types
 // ----------------------------------------------------------------------------
 namespace nlohmann {

 template <>
 struct adl_serializer<muxbridge::config::SuperuserBridge> {
     static void to_json(json& j, muxbridge::config::SuperuserBridge const& b) {
         j = json{
             {"label", b.label},
             {"spawn", b.spawn}
         };
         if (!b.environ.empty()) j["environ"] = b.environ;
         if (b.privileged)       j["privileged"] = true;
     }
     static void from_json(json const& j, muxbridge::config::SuperuserBridge& b) {
         j.at("spawn").get_to(b.spawn);
         if (j.contains("label"))      j.at("label").get_to(b.label);
         if (j.contains("environ"))    j.at("environ").get_to(b.environ);
         if (j.contains("privileged")) j.at("privileged").get_to(b.privileged);
     }
 };

 template <>
 struct adl_serializer<muxbridge::config::BridgeConfig> {
     static void to_json(json& j, muxbridge::config::BridgeConfig const& c) {
         j = json{{"superuser-bridges", c.superuserBridges}};
     }
     static void from_json(json const& j, muxbridge::config::BridgeConfig& c) {
         if (j.contains("superuser-bridges"))
             j.at("superuser-bridges").get_to(c.superuserBridges);
     }
 };

 } // namespace nlohmann

 #endif // MUXBRIDGE_CONFIG_HPP

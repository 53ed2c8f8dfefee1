/*! \mainpage Beacon
 *
 * \section intro Introduction
 * Beacon is an SSDP (Simple Service Discovery Protocol) engine and discovery client for UPnP/DLNA networks.
 *
 * \section programs Programs
 *   - beacon-discover
 *     - Searches every local interface for media renderers and reports devices as they appear and leave.
 *
 * \section beaconlibraries Internal libraries
 * \subsection libbeacon-core libbeacon-core
 *   - Logging, command line, events, the settings database and the local context.
 *   - upnp/ - the SSDP engine (BeaconSSDP), the discovery cache (BeaconSSDPLocator),
 *     the message codec and the device tree model.
 *
 * \section extlibraries External libraries
 *   - Qt 5 (Core, Network, Sql)
 *   - GoogleTest (tests only)
 */

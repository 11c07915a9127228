#pragma once

namespace upbus { namespace net {
/**
 * the NetworkTransport config parameters and their default values
 */
constexpr char const*  const DefaultUserConfig = R"|(
{
    "ifaceAddr"                 : "127.0.0.1",              "__ifaceAddr"                   :"ip address for the NIC interface for IO, 0.0.0.0/0 pointing to the first intereface that is not a loopback (127.0.0.1)",
    "multicastBoundToIface"     : false,                    "__multicastBoundToIface"       :"bind the sockets to the ifaceAddr NIC, needs CAP_NET_RAW",
    "mtu"                       : 1500,                     "__mtu"                         :"mtu, check ifconfig output for this value for each NIC in use. A message and its header need to fit in one datagram",
    "schedPolicy"               : "SCHED_OTHER",            "__schedPolicy"                 :"receive thread schedule policy - check man page for allowed values",
    "schedPriority"             : 0,                        "__schedPriority"               :"receive thread schedule priority - check man page for allowed values",
    "tx" :
    {
        "loopback"              : true,                     "__loopback"              :"should multicast messages be visible in local machine",
        "ttl"                   : 1,                        "__ttl"                   :"the switch hop number",
        "udpcastDests"          : "232.43.212.234:4321",    "__udpcastDests"          :"list UDP address port pairs every message goes to (each of them), for example \"127.0.0.1:3241 192.168.0.1:3241\" - can be a mix of multicast addresses and unicast addresses",
        "udpSendBufferBytes"    : 0,                        "__udpSendBufferBytes"    :"OS buffer byte size for outgoing udp, 0 means OS default value"
    },
    "rx" :
    {
        "threadName"            : "upbus-rx",           "__threadName"              :"receive thread name",
        "udpcastListenAddr"     : "232.43.212.234",     "__udpcastListenAddr"       :"listen to this address for messages - it can be set to ifaceAddr to listen to unicast UDP messages instead of a multicast address",
        "udpcastListenPort"     : 4321,                 "__udpcastListenPort"       :"listen to this UDP port for messages, 0 picks a free port",
        "udpRecvBufferBytes"    : 0,                    "__udpRecvBufferBytes"      :"OS buffer byte size for incoming udp, 0 means OS default value",
        "pollWaitMillisec"      : 100,                  "__pollWaitMillisec"        :"longest time the receive thread waits for a datagram before checking if it is stopped",
        "dropOwnMessages"       : false,                "__dropOwnMessages"         :"do not deliver messages this transport sent itself"
    }
}
)|";
}}

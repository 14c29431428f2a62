#pragma once

namespace lan_watch::server
{
    // Sized for small wall displays (800x240); polls /api/devices every 5s.
    inline constexpr const char *DASHBOARD_HTML = R"HTML(<!doctype html>
<html lang="en">
<head>
  <meta charset="utf-8">
  <title>LAN Watch</title>
  <meta name="viewport" content="width=device-width, initial-scale=1">
  <style>
    html, body { margin: 0; padding: 0; width: 100%; height: 100%; background: #111; color: #eee;
      font-family: system-ui, -apple-system, "Segoe UI", sans-serif; overflow: hidden; font-size: 0.9rem; }
    .header { padding: 2px 6px; display: flex; justify-content: space-between; align-items: center;
      background: #000; box-shadow: 0 2px 4px rgba(0,0,0,0.7); }
    .header h1 { margin: 0; font-size: 0.95rem; font-weight: 500; }
    .header .info { font-size: 0.75rem; opacity: 0.8; text-align: right; line-height: 1.1; }
    .container { position: absolute; top: 28px; left: 0; right: 0; bottom: 0; padding: 2px 4px;
      box-sizing: border-box; display: grid; grid-template-columns: repeat(auto-fill, minmax(120px, 1fr));
      grid-auto-rows: minmax(34px, auto); gap: 4px; overflow: auto; }
    .bubble { border-radius: 4px; display: flex; flex-direction: column; justify-content: center;
      padding: 2px 4px; box-sizing: border-box; box-shadow: 0 0 3px rgba(0,0,0,0.6); }
    .bubble.online { background-color: #4caf50; }
    .bubble.offline-required { background-color: #b71c1c; }
    .bubble.new-online { background-color: #2196f3; }
    .bubble.vip-online { background-color: #1d471c; }
    .hostname { font-size: 0.8rem; font-weight: 600; word-break: break-word; }
    .ip { font-size: 0.7rem; opacity: 0.9; }
    .status { font-size: 0.65rem; opacity: 0.85; }
    @keyframes blink { 0%, 50%, 100% { opacity: 1; } 25%, 75% { opacity: 0.3; } }
    .blink { animation: blink 1s infinite; }
  </style>
</head>
<body>
  <div class="header">
    <h1>LAN Watch</h1>
    <div class="info">Network: <span id="net"></span><br>Devices: <span id="count">0</span> &middot; <span id="ts">-</span></div>
  </div>
  <div class="container" id="bubbles"></div>
<script>
  const REFRESH_INTERVAL_MS = 5000;

  function formatAge(seconds) {
    if (seconds == null) return "-";
    const s = Math.floor(seconds);
    const h = Math.floor(s / 3600);
    const m = Math.floor((s % 3600) / 60);
    if (h > 0) return h + "h " + m + "m";
    if (m > 0) return m + "m " + (s % 60) + "s";
    return s + "s";
  }

  function tileClasses(dev) {
    const classes = ["bubble"];
    if (dev.online) {
      if (dev.vip) {
        classes.push("vip-online");
        if (dev.is_new) classes.push("blink");
      } else if (dev.is_new) {
        classes.push("new-online", "blink");
      } else {
        classes.push("online");
      }
    } else if (dev.required) {
      classes.push("offline-required", "blink");
    }
    return classes.join(" ");
  }

  function statusText(dev) {
    if (dev.online) return "online for " + formatAge(dev.age_seconds);
    if (dev.last_seen_seconds_ago != null) return "offline for " + formatAge(dev.last_seen_seconds_ago);
    return "offline (never reached)";
  }

  async function loadDevices() {
    try {
      const res = await fetch("/api/devices");
      const data = await res.json();
      const container = document.getElementById("bubbles");
      container.innerHTML = "";
      document.getElementById("net").textContent = data.network;
      document.getElementById("count").textContent = data.devices.length;
      document.getElementById("ts").textContent = new Date().toLocaleTimeString();

      data.devices.forEach(dev => {
        const bubble = document.createElement("div");
        bubble.className = tileClasses(dev);

        const name = document.createElement("div");
        name.className = "hostname";
        name.textContent = dev.hostname || dev.ip;
        bubble.appendChild(name);

        if (dev.hostname) {
          const ip = document.createElement("div");
          ip.className = "ip";
          ip.textContent = dev.ip;
          bubble.appendChild(ip);
        }

        const status = document.createElement("div");
        status.className = "status";
        status.textContent = statusText(dev);
        bubble.appendChild(status);

        container.appendChild(bubble);
      });
    } catch (e) {
      console.error("Failed to load devices", e);
    }
  }

  loadDevices();
  setInterval(loadDevices, REFRESH_INTERVAL_MS);
</script>
</body>
</html>
)HTML";
}

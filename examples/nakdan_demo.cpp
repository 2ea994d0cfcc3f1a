#include <cstdint>
#include <cstring>

#include <iostream>
#include <memory>
#include <string>

#include "nakdan_api.hpp"

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项]\n"
        << "\n"
        << "选项:\n"
        << "  -p <text>      为指定文本加注音\n"
        << "  -m <model>     ONNX 模型路径 (默认: ~/.cache/nakdimon/nakdimon.onnx)\n"
        << "  -n <length>    模型输入长度 (默认: 10000, 动态长度模型使用)\n"
        << "  --strip        只去除已有注音, 不运行模型\n"
        << "  --live         逐字输入文本, 演示防抖生成\n"
        << "  -h             显示帮助\n"
        << "\n"
        << "交互模式:\n"
        << "  不带 -p 参数时进入交互模式，输入文本后按 Enter 加注音\n"
        << "  输入 'q' 或 'quit' 退出\n"
        << "\n"
        << "示例:\n"
        << "  " << program << "                                  # 交互模式\n"
        << "  " << program << " -p \"שלום עולם\"                  # 单次调用\n"
        << "  " << program << " -p \"שָׁלוֹם\" --strip               # 去除注音\n"
        << "  " << program << " -p \"שלום עולם\" --live           # 防抖生成\n"
        << std::endl;
}

bool vocalize(Nakdan::NakdanEngine& engine, const std::string& text) {
    auto result = engine.Call(text);

    if (!result || !result->IsSuccess()) {
        std::cerr << "加注音失败";
        if (result) {
            std::cerr << " [" << result->GetCode() << "]: " << result->GetMessage();
        }
        std::cerr << std::endl;
        return false;
    }

    std::cout << result->GetText() << std::endl;
    std::cout << "处理时间: " << result->GetProcessingTimeMs() << " ms" << std::endl;
    return true;
}

// 模拟键盘输入: 每个 UTF-8 字符触发一次 Generate(), 只有最后一次产生结果
class LiveCallback : public Nakdan::NakdanCallback {
public:
    void OnResult(std::shared_ptr<Nakdan::NakdanResult> result) override {
        std::cout << "[#" << result->GetRequestId() << "] " << result->GetText()
                  << " (" << result->GetProcessingTimeMs() << " ms)" << std::endl;
    }

    void OnError(std::shared_ptr<Nakdan::NakdanResult> result) override {
        std::cerr << "[#" << result->GetRequestId() << "] 失败 ["
                  << result->GetCode() << "]: " << result->GetMessage() << std::endl;
    }
};

bool live(Nakdan::NakdanEngine& engine, const std::string& text) {
    engine.SetCallback(std::make_shared<LiveCallback>());

    std::string typed;
    for (size_t i = 0; i < text.size(); ++i) {
        typed.push_back(text[i]);
        // UTF-8 续字节不单独提交
        if (i + 1 < text.size() && (static_cast<unsigned char>(text[i + 1]) & 0xC0) == 0x80) {
            continue;
        }
        engine.Generate(typed);
    }

    if (!engine.WaitForIdle(60000)) {
        std::cerr << "等待超时" << std::endl;
        engine.Cancel();
        return false;
    }
    engine.SetCallback(nullptr);
    return !engine.HasError();
}

int main(int argc, char* argv[]) {
    std::string text;
    std::string model_path;
    int64_t max_length = 0;
    bool interactive = true;
    bool strip_only = false;
    bool live_mode = false;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            text = argv[++i];
            interactive = false;
        } else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            model_path = argv[++i];
        } else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            max_length = std::stoll(argv[++i]);
        } else if (strcmp(argv[i], "--strip") == 0) {
            strip_only = true;
        } else if (strcmp(argv[i], "--live") == 0) {
            live_mode = true;
        }
    }

    if (strip_only) {
        if (text.empty()) {
            std::cerr << "错误: --strip 需要 -p 指定文本" << std::endl;
            return 1;
        }
        std::cout << Nakdan::NakdanEngine::StripNiqqud(text) << std::endl;
        return 0;
    }

    // 创建配置
    Nakdan::NakdanConfig config = Nakdan::NakdanConfig::Default();
    if (!model_path.empty()) {
        config = config.withModelPath(model_path);
    }
    if (max_length > 0) {
        config = config.withMaxLength(max_length);
    }

    std::cout << "加载模型: " << config.model_path << std::endl;

    Nakdan::NakdanEngine engine(config);
    if (!engine.LoadModel()) {
        std::cerr << "模型加载失败!" << std::endl;
        return 1;
    }

    std::cout << "引擎: " << engine.GetEngineName() << std::endl;
    std::cout << std::endl;

    if (interactive) {
        // 交互模式
        std::cout << "进入交互模式，输入文本后按 Enter 加注音 (输入 q 退出)" << std::endl;
        std::cout << "----------------------------------------" << std::endl;

        std::string line;
        while (true) {
            std::cout << "> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            if (line.empty()) {
                continue;
            }

            if (line == "q" || line == "quit" || line == "exit") {
                std::cout << "再见!" << std::endl;
                break;
            }

            vocalize(engine, line);
            std::cout << std::endl;
        }
    } else {
        if (text.empty()) {
            std::cerr << "错误: 请使用 -p 指定文本" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        bool ok = live_mode ? live(engine, text) : vocalize(engine, text);
        if (!ok) {
            return 1;
        }
    }

    return 0;
}
